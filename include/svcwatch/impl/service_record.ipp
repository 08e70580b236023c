#include <svcwatch/error.hpp>
#include <svcwatch/service_record.hpp>

#include <string>
#include <utility>

namespace svcwatch {

auto make_service_key(std::string_view name, std::string_view type) -> std::string {
  std::string key;
  key.reserve(name.size() + type.size() + 7);
  key.append(name);
  key.push_back('.');
  key.append(type);
  if (!type.empty() && type.back() != '.') {
    key.push_back('.');
  }
  key.append("local");
  return key;
}

auto first_label(std::string_view fqdn) noexcept -> std::string_view {
  auto const dot = fqdn.find('.');
  if (dot == std::string_view::npos) {
    return fqdn;
  }
  return fqdn.substr(0, dot);
}

auto make_service_record(resolve_result const& r) -> result<service_record> {
  if (r.srv.fqdn.empty()) {
    return unexpected(make_error_code(error::malformed_record));
  }

  service_record rec;
  rec.service_name = std::string{first_label(r.srv.fqdn)};
  rec.full_name = r.srv.fqdn;
  rec.host = r.srv.target;
  rec.port = r.srv.port;
  rec.addresses = r.addresses;
  rec.attributes = r.txt;
  return rec;
}

auto make_service_record(discovered_service const& s) -> service_record {
  service_record rec;
  rec.service_name = s.name;
  rec.full_name = make_service_key(s.name, s.type);
  rec.host = s.host;
  rec.port = s.port;
  return rec;
}

}  // namespace svcwatch
