#include "device_sql.hpp"

namespace netsweep::db::sql {

namespace {

class WhereBuilder {
 public:
  WhereBuilder(Dialect dialect, int first_placeholder) : dialect_(dialect), next_(first_placeholder) {
  }

  std::string Placeholder(Param value) {
    fragment_.params.push_back(std::move(value));
    if (dialect_ == Dialect::kSqlite) return "?";
    return "$" + std::to_string(next_++);
  }

  void Add(const std::string& condition) {
    fragment_.sql += fragment_.sql.empty() ? " WHERE " : " AND ";
    fragment_.sql += condition;
  }

  Fragment Take() {
    return std::move(fragment_);
  }

 private:
  Dialect  dialect_;
  int      next_;
  Fragment fragment_;
};

std::string Column(NativeSortField field) {
  switch (field) {
    case NativeSortField::kLastSeen:
      return "last_seen_ms";
    case NativeSortField::kFirstSeen:
      return "first_seen_ms";
    case NativeSortField::kStatus:
      return "status";
    case NativeSortField::kPingLatency:
      return "ping_latency_ms";
    case NativeSortField::kScanCount:
      return "scan_count";
  }
  return "last_seen_ms";
}

} // namespace

Fragment BuildDeviceWhere(const DeviceFilter& filter, Dialect dialect, int first_placeholder) {
  WhereBuilder where(dialect, first_placeholder);

  if (filter.status) {
    where.Add("status = " + where.Placeholder(std::string(netsweep::model::ToString(*filter.status))));
  }

  if (filter.ip_prefix && !filter.ip_prefix->empty()) {
    const auto length = static_cast<int64_t>(filter.ip_prefix->size());
    if (dialect == Dialect::kSqlite) {
      where.Add("substr(ip, 1, " + where.Placeholder(length) + ") = " + where.Placeholder(*filter.ip_prefix));
    } else {
      where.Add("left(ip, " + where.Placeholder(length) + "::int) = " + where.Placeholder(*filter.ip_prefix));
    }
  }

  if (filter.search && !filter.search->empty()) {
    // instr/strpos instead of LIKE so user input needs no escaping.
    const std::string needle = *filter.search;
    if (dialect == Dialect::kSqlite) {
      auto contains = [&](const std::string& expr) { return "instr(lower(" + expr + "), lower(" + where.Placeholder(needle) + ")) > 0"; };
      where.Add("(" + contains("ip") + " OR " + contains("COALESCE(mac,'')") + " OR " + contains("COALESCE(hostname,'')") + " OR " +
                contains("COALESCE(vendor,'')") +
                " OR EXISTS (SELECT 1 FROM json_tree(CASE WHEN json_valid(extra_info) THEN extra_info ELSE '{}' END) "
                "WHERE type IN ('text','integer','real') AND " +
                contains("CAST(value AS TEXT)") + "))");
    } else {
      auto contains = [&](const std::string& expr) { return "strpos(lower(" + expr + "), lower(" + where.Placeholder(needle) + ")) > 0"; };
      where.Add("(" + contains("ip") + " OR " + contains("COALESCE(mac,'')") + " OR " + contains("COALESCE(hostname,'')") + " OR " +
                contains("COALESCE(vendor,'')") +
                " OR EXISTS (SELECT 1 FROM jsonb_path_query(extra_info, 'strict $.**') AS leaf(v) "
                "WHERE jsonb_typeof(leaf.v) IN ('string','number') AND " +
                contains("leaf.v #>> '{}'") + "))");
    }
  }

  if (filter.last_seen_since_ms) {
    where.Add("last_seen_ms >= " + where.Placeholder(*filter.last_seen_since_ms));
  }
  if (filter.last_seen_until_ms) {
    where.Add("last_seen_ms <= " + where.Placeholder(*filter.last_seen_until_ms));
  }

  return where.Take();
}

std::string BuildDeviceOrderBy(const NativeOrder& order) {
  const auto column    = Column(order.field);
  const auto direction = order.order == SortOrder::kAsc ? " ASC" : " DESC";
  return " ORDER BY (" + column + " IS NULL) ASC, " + column + direction + ", ip ASC";
}

} // namespace netsweep::db::sql
