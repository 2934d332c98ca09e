#pragma once

#include "rmm/common/result.hpp"

#include <string>
#include <string_view>

namespace rmm::providers {

/// Text-in/text-out language model used for extraction and Add/Merge decisions.
class ILlmClient {
public:
  virtual ~ILlmClient() = default;

  [[nodiscard]] virtual common::Result<std::string> generate(const std::string &prompt) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace rmm::providers
