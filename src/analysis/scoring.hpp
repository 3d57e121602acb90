#ifndef SCORING_HPP
#define SCORING_HPP

#include <cstddef>
#include <cstdint>

namespace Scoring {

// Per-address weights. The composite is a plain weighted sum.
namespace AddressWeights {
constexpr double VOLUME = 0.002;
constexpr double SERVER_ERROR = 0.02;
constexpr double CLIENT_ERROR = 0.01;
constexpr double ABNORMAL = 0.05;
constexpr double LOGIN_PROBE = 0.03;
constexpr double IDENTITY_QUERY = 0.02;
constexpr double PEAK_RPM = 0.01;
} // namespace AddressWeights

namespace EndpointWeights {
constexpr uint64_t SQLI_HIT = 3;
constexpr uint64_t SQLI_SERVER_ERROR = 2;
constexpr uint64_t UNIQUE_PAYLOAD = 1;
} // namespace EndpointWeights

// Characters of the raw request target that identify a distinct payload
constexpr size_t PAYLOAD_SIGNATURE_LENGTH = 200;

inline double address_score(size_t requests, size_t server_errors,
                            size_t client_errors, size_t abnormal,
                            size_t login_probes, size_t identity_queries,
                            size_t peak_rpm) {
  using namespace AddressWeights;
  return VOLUME * static_cast<double>(requests) +
         SERVER_ERROR * static_cast<double>(server_errors) +
         CLIENT_ERROR * static_cast<double>(client_errors) +
         ABNORMAL * static_cast<double>(abnormal) +
         LOGIN_PROBE * static_cast<double>(login_probes) +
         IDENTITY_QUERY * static_cast<double>(identity_queries) +
         PEAK_RPM * static_cast<double>(peak_rpm);
}

inline uint64_t endpoint_score(uint64_t sqli_hits, uint64_t sqli_server_errors,
                               uint64_t unique_payloads) {
  using namespace EndpointWeights;
  return SQLI_HIT * sqli_hits + SQLI_SERVER_ERROR * sqli_server_errors +
         UNIQUE_PAYLOAD * unique_payloads;
}

} // namespace Scoring

#endif // SCORING_HPP
