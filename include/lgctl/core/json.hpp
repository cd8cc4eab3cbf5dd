#ifndef lgctl_CORE_JSON_HPP
#define lgctl_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace lgctl {

typedef nlohmann::json Json;

} // namespace lgctl

#endif // lgctl_CORE_JSON_HPP
