#include "rmm/providers/traits.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/common/json_util.hpp"

#include <curl/curl.h>

#include <charconv>
#include <sstream>

namespace rmm::providers {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    (*headers)[key] = common::trim(header.substr(separator + 1));
  }
  return total;
}

std::optional<std::uint64_t> parse_retry_after(const HttpResponse &response) {
  const auto it = response.headers.find("retry-after");
  if (it == response.headers.end()) {
    return std::nullopt;
  }
  std::uint64_t seconds = 0;
  const auto &value = it->second;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return seconds;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "rmm/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

common::Status check_http_response(const HttpResponse &response) {
  if (response.timeout) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"}
            .to_string());
  }
  if (response.network_error) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }
  if (response.status == 401 || response.status == 403) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::AuthError,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }
  if (response.status == 404) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ModelNotFound,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }
  if (response.status == 429) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::RateLimitError,
                                               .status = response.status,
                                               .message = response.body,
                                               .retry_after = parse_retry_after(response)}
                                     .to_string());
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ApiError,
                                               .status = response.status,
                                               .message = response.body}
                                     .to_string());
  }
  return common::Status::success();
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const std::string choices = common::json_get_array(response, "choices");
  if (choices.empty()) {
    return common::Result<std::string>::failure("choices field missing");
  }
  const auto entries = common::json_split_array(choices);
  if (!entries.ok() || entries.value().empty()) {
    return common::Result<std::string>::failure("choices array is empty");
  }

  const std::string message = common::json_get_object(entries.value().front(), "message");
  if (message.empty()) {
    return common::Result<std::string>::failure("choices[0].message missing");
  }
  auto content = common::json_get_string(message, "content");
  if (!content.has_value()) {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  return common::Result<std::string>::success(std::move(*content));
}

} // namespace rmm::providers
