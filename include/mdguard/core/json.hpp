/*
 * mdguard C++17 - JSON type
 *
 * nlohmann::json under the project-wide name used for config files and
 * serialized records.
 */
#ifndef mdguard_CORE_JSON_HPP
#define mdguard_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace mdguard {

typedef nlohmann::json Json;

} // namespace mdguard

#endif // mdguard_CORE_JSON_HPP
