#include "rmm/memory/extraction.hpp"

#include "rmm/common/fs.hpp"
#include "rmm/common/id.hpp"
#include "rmm/common/json_util.hpp"
#include "rmm/memory/prompts.hpp"
#include "rmm/observability/factory.hpp"

#include <cmath>
#include <exception>
#include <sstream>

namespace rmm::memory {

namespace {

std::string strip_code_fence(const std::string &text) {
  std::string body = common::trim(text);
  if (!common::starts_with(body, "```")) {
    return body;
  }
  const auto first_newline = body.find('\n');
  if (first_newline == std::string::npos) {
    return body;
  }
  body = body.substr(first_newline + 1);
  const auto closing = body.rfind("```");
  if (closing != std::string::npos) {
    body = body.substr(0, closing);
  }
  return common::trim(body);
}

common::Result<std::vector<int>> parse_references(const std::string &array_json) {
  using ResultT = common::Result<std::vector<int>>;
  if (array_json.empty()) {
    return ResultT::success({});
  }
  auto numbers = common::json_parse_number_array(array_json);
  if (!numbers.ok()) {
    return ResultT::failure(numbers.error());
  }
  std::vector<int> out;
  out.reserve(numbers.value().size());
  for (const double value : numbers.value()) {
    if (value < 0 || value != std::floor(value) || value > 1'000'000) {
      return ResultT::failure("reference must be a non-negative turn index");
    }
    out.push_back(static_cast<int>(value));
  }
  return ResultT::success(std::move(out));
}

std::string raw_dialogue_for(const std::vector<StoredMessage> &messages,
                             const std::vector<int> &references) {
  std::string out;
  for (const int turn : references) {
    const auto index = static_cast<std::size_t>(turn) * 2;
    if (index >= messages.size() || messages[index].content.empty()) {
      continue;
    }
    if (!out.empty()) {
      out += " | ";
    }
    out += messages[index].content;
  }
  return out;
}

} // namespace

std::string format_dialogue(const std::vector<StoredMessage> &messages) {
  std::ostringstream out;
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (i > 0) {
      out << '\n';
    }
    out << "* Turn " << i / 2 << ":\n  – " << messages[i].type << ": " << messages[i].content;
  }
  return out.str();
}

common::Result<std::vector<ExtractedSummary>> parse_extraction_output(const std::string &output) {
  using ResultT = common::Result<std::vector<ExtractedSummary>>;
  const std::string body = strip_code_fence(output);
  if (body == "NO_TRAIT") {
    return ResultT::success({});
  }

  const std::string memories_json = common::json_get_array(body, "extracted_memories");
  if (memories_json.empty()) {
    return ResultT::failure("extraction output has no extracted_memories array");
  }
  auto elements = common::json_split_array(memories_json);
  if (!elements.ok()) {
    return ResultT::failure(elements.error());
  }

  std::vector<ExtractedSummary> out;
  for (const auto &element : elements.value()) {
    const auto summary = common::json_get_string(element, "summary");
    if (!summary.has_value() || common::trim(*summary).empty()) {
      continue;
    }
    auto references = parse_references(common::json_get_array(element, "reference"));
    if (!references.ok()) {
      return ResultT::failure(references.error());
    }
    out.push_back(ExtractedSummary{.summary = *summary, .reference = std::move(references.value())});
  }
  return ResultT::success(std::move(out));
}

MemoryExtractor::MemoryExtractor(std::shared_ptr<providers::ILlmClient> llm,
                                 std::shared_ptr<IEmbedder> embedder,
                                 std::shared_ptr<observability::IObserver> observer)
    : llm_(std::move(llm)), embedder_(std::move(embedder)),
      observer_(observer != nullptr ? std::move(observer) : observability::noop_observer()) {}

common::Result<std::vector<MemoryEntry>>
MemoryExtractor::extract(const std::vector<StoredMessage> &messages,
                         const std::optional<std::string> &session_id) {
  using ResultT = common::Result<std::vector<MemoryEntry>>;
  if (messages.empty()) {
    return ResultT::success({});
  }
  if (llm_ == nullptr || embedder_ == nullptr) {
    return ResultT::failure("extractor is missing its LLM or embedder");
  }

  common::Result<std::string> response = common::Result<std::string>::failure("not called");
  try {
    response = llm_->generate(extraction_prompt(format_dialogue(messages)));
  } catch (const std::exception &ex) {
    return ResultT::failure(std::string("extraction LLM threw: ") + ex.what());
  } catch (...) {
    return ResultT::failure("extraction LLM threw a non-standard exception");
  }
  if (!response.ok()) {
    return ResultT::failure("extraction LLM failed: " + response.error());
  }

  auto parsed = parse_extraction_output(response.value());
  if (!parsed.ok()) {
    observer_->record_event(observability::WarningEvent{
        .component = "extraction", .message = "unparseable output: " + parsed.error()});
    return ResultT::failure(parsed.error());
  }
  const auto &extracted = parsed.value();
  if (extracted.empty()) {
    return ResultT::success({});
  }

  std::vector<std::string> summaries;
  summaries.reserve(extracted.size());
  for (const auto &item : extracted) {
    summaries.push_back(item.summary);
  }
  common::Result<std::vector<std::vector<double>>> embeddings =
      common::Result<std::vector<std::vector<double>>>::failure("not called");
  try {
    embeddings = embedder_->embed_batch(summaries);
  } catch (const std::exception &ex) {
    return ResultT::failure(std::string("embedding extracted memories threw: ") + ex.what());
  } catch (...) {
    return ResultT::failure("embedding extracted memories threw a non-standard exception");
  }
  if (!embeddings.ok()) {
    return ResultT::failure("embedding extracted memories failed: " + embeddings.error());
  }
  if (embeddings.value().size() != extracted.size()) {
    return ResultT::failure("embedder returned " + std::to_string(embeddings.value().size()) +
                            " vectors for " + std::to_string(extracted.size()) + " summaries");
  }

  const std::int64_t timestamp = common::now_ms();
  const std::string effective_session =
      session_id.has_value() && !session_id->empty() ? *session_id : common::generate_uuid();

  std::vector<MemoryEntry> out;
  out.reserve(extracted.size());
  for (std::size_t i = 0; i < extracted.size(); ++i) {
    std::string raw = raw_dialogue_for(messages, extracted[i].reference);
    out.push_back(MemoryEntry{
        .id = common::generate_uuid(),
        .topic_summary = extracted[i].summary,
        .raw_dialogue = raw.empty() ? extracted[i].summary : std::move(raw),
        .timestamp = timestamp,
        .session_id = effective_session,
        .embedding = std::move(embeddings.value()[i]),
        .turn_references = extracted[i].reference,
    });
  }
  return ResultT::success(std::move(out));
}

} // namespace rmm::memory
