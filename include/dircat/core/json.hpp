#ifndef dircat_CORE_JSON_HPP
#define dircat_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace dircat {

typedef nlohmann::json Json;

} // namespace dircat

#endif // dircat_CORE_JSON_HPP
