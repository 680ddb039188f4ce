#include "domainflow/validation/http_validator.hpp"

#include "domainflow/util/digest.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>

namespace domainflow::http_check {

namespace {

[[nodiscard]] auto is_space(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto collapse_whitespace(std::string_view s) -> std::string {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (char c : s) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

} // namespace

auto target_url(std::string_view domain, std::uint16_t port) -> std::string {
  switch (port) {
  case 443:
    return std::format("https://{}/", domain);
  case 80:
  case 0:
    return std::format("http://{}/", domain);
  default:
    return std::format("http://{}:{}/", domain, port);
  }
}

auto extract_title(std::string_view html) -> std::string {
  const auto lowered = to_lower_ascii(html);
  auto open = lowered.find("<title");
  if (open == std::string::npos) {
    return {};
  }
  auto start = lowered.find('>', open);
  if (start == std::string::npos) {
    return {};
  }
  ++start;
  auto end = lowered.find("</title", start);
  if (end == std::string::npos) {
    return {};
  }
  return collapse_whitespace(html.substr(start, end - start));
}

auto make_snippet(std::string_view body) -> std::string {
  if (body.size() <= kSnippetBytes) {
    return std::string(body);
  }
  std::string out(body.substr(0, kSnippetBytes));
  out.append("...");
  return out;
}

auto status_allowed(std::int32_t status, std::span<const std::int32_t> allowed)
    -> bool {
  if (allowed.empty()) {
    return status >= 200 && status < 300;
  }
  return std::ranges::find(allowed, status) != allowed.end();
}

auto build_request(const HttpPersonaConfig &persona,
                   const HttpValidationParams &params,
                   const HttpConfig &defaults, std::string url,
                   const Proxy *proxy) -> HttpFetchRequest {
  HttpFetchRequest req;
  req.url = std::move(url);
  req.headers = persona.headers;
  req.headers.insert_or_assign(
      "User-Agent",
      persona.user_agent.empty() ? defaults.user_agent : persona.user_agent);
  req.proxy = proxy;
  req.follow_redirects =
      persona.follow_redirects.value_or(params.follow_redirects);
  req.max_redirects = std::max(0, params.max_redirects);
  req.max_body_bytes = persona.max_body_read_bytes > 0
                           ? persona.max_body_read_bytes
                           : defaults.max_body_read_bytes;
  req.insecure_tls = persona.allow_insecure_tls;
  const auto seconds = persona.request_timeout_seconds > 0
                           ? persona.request_timeout_seconds
                           : params.settings.request_timeout_seconds;
  req.timeout = std::chrono::seconds(std::max(1, seconds));
  return req;
}

auto classify(const HttpFetchResponse &response,
              const HttpPersonaConfig &persona, const KeywordMatcher &matcher,
              HttpResult &out) -> void {
  out.system_status = SystemStatus::Ok;
  out.http_status_code = response.status_code;
  out.final_url = response.final_url;
  out.redirect_count = response.redirect_count;
  out.content_length = response.content_length;
  out.content_hash = util::sha256_hex(response.body);
  out.page_title = extract_title(response.body);
  out.content_snippet = make_snippet(response.body);
  out.error.clear();

  if (!status_allowed(response.status_code, persona.allowed_status_codes)) {
    out.status = HttpStatus::AccessDenied;
    out.findings = {};
    return;
  }
  out.findings = matcher.match(response.body);
  out.status =
      out.findings.any() ? HttpStatus::KeywordsFound : HttpStatus::NoKeywords;
}

} // namespace domainflow::http_check
