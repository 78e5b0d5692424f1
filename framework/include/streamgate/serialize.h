#ifndef STREAMGATE_SERIALIZE_H
#define STREAMGATE_SERIALIZE_H

#include <boost/json/conversion.hpp>
#include <boost/json/value.hpp>
#include <streamgate/circuit_breaker.h>
#include <streamgate/instance_registry.h>
#include <streamgate/load_balancer.h>
#include <streamgate/metrics.h>

// Boost.JSON conversions for the admin payloads, found by ADL through
// boost::json::value_from. Keys are camelCase to match the envelope.
namespace streamgate {

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Health& h);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const EndpointSnapshot& ep);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const HealthSummary& s);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const LoadBalancerStats& s);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const CircuitBreakerSnapshot& s);

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const ServiceBreakdown& b);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const AggregatedMetrics& m);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const ServiceMetrics& m);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const SlowEndpoint& e);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const ErrorDistribution& d);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const TrafficBucket& b);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const UserActivity& a);
void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const HealthScore& s);

} // namespace streamgate

#endif // STREAMGATE_SERIALIZE_H
