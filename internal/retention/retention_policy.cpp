#include "retention_policy.hpp"

#include <stdexcept>

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace netsweep::retention {

namespace cfg = netsweep::runtime::config;

RetentionPolicy FromProto(const cfg::RetentionPolicy& proto, const RetentionPolicy& fallback) {
  RetentionPolicy policy = fallback;
  if (proto.has_history_days()) policy.history_days = proto.history_days();
  if (proto.has_scans_days()) policy.scans_days = proto.scans_days();
  if (proto.has_offline_days()) policy.offline_days = proto.offline_days();
  if (proto.has_latency_days()) policy.latency_days = proto.latency_days();
  if (proto.has_auto_purge()) policy.auto_purge = proto.auto_purge();
  if (proto.has_purge_interval()) policy.purge_interval = util::FromProto(proto.purge_interval(), fallback.purge_interval);
  return policy;
}

cfg::RetentionPolicy ToProto(const RetentionPolicy& policy) {
  cfg::RetentionPolicy proto;
  proto.set_history_days(policy.history_days);
  proto.set_scans_days(policy.scans_days);
  proto.set_offline_days(policy.offline_days);
  proto.set_latency_days(policy.latency_days);
  proto.set_auto_purge(policy.auto_purge);
  *proto.mutable_purge_interval() = util::ToProto(policy.purge_interval);
  return proto;
}

std::string ToJson(const RetentionPolicy& policy) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(ToProto(policy), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("retention policy serialization failed: " + std::string(status.message()));
  }
  return json;
}

RetentionPolicy FromJson(const std::string& json, const RetentionPolicy& fallback) {
  cfg::RetentionPolicy proto;
  const auto           status = google::protobuf::util::JsonStringToMessage(json, &proto);
  if (!status.ok()) {
    throw util::ValidationError("invalid retention policy: " + std::string(status.message()));
  }
  return FromProto(proto, fallback);
}

} // namespace netsweep::retention
