#pragma once

#include "rmm/memory/types.hpp"

#include <string>
#include <vector>

namespace rmm::memory {

/// Add/Merge decision prompt over the neighbours' summaries and the new summary.
[[nodiscard]] std::string update_memory_prompt(const std::vector<std::string> &history_summaries,
                                               const std::string &new_summary);

/// Personal-summary extraction prompt for a formatted dialogue session.
[[nodiscard]] std::string extraction_prompt(const std::string &dialogue_session);

/// Answer-with-citations prompt for a query and a formatted memory block.
[[nodiscard]] std::string citation_prompt(const std::string &user_query,
                                          const std::string &memories_block);

/// "<memories>" block listing each memory as "– Memory [i]: summary" plus its dialogue.
[[nodiscard]] std::string format_memories_block(const std::vector<RetrievedMemory> &memories);

[[nodiscard]] std::string escape_xml(const std::string &text);

} // namespace rmm::memory
