#include "rmm/memory/prompts.hpp"

#include "rmm/common/json_util.hpp"

#include <sstream>

namespace rmm::memory {

namespace {

constexpr const char *kUpdateMemoryTemplate =
    R"(Task Description: Given a list of history personal summaries for a specific user and a new
and similar personal summary from the same user, update the personal history summaries
following the instructions below:

* Input format: Both the history personal summaries and the new personal summary
  are provided in JSON format, with the top-level keys of "history_summaries" and
  "new_summary".
* Possible update actions:
  – Add: If the new personal summary is not relevant to any history personal summary,
    add it.
    Format: Add()
  – Merge: If the new personal summary is relevant to a history personal summary,
    merge them as an updated summary.
    Format: Merge(index, merged_summary)
    Note: index is the position of the relevant history summary in the list.
    merged_summary is the merged summary of the new summary and the relevant history
    summary. Two summaries are considered relevant if they discuss the same aspect
    of the user's personal information or experiences.
* If multiple actions need to be executed, output each action in a single line, and
  separate them with a newline character ("\n").
* Do not include additional explanations or examples in the output, only return the
  required action functions.

Example:
INPUT:
* History Personal Summaries:
  – {"history_summaries": ["SPEAKER_1 works out although he doesn't particularly enjoy it."]}
* New Personal Summary:
  – {"new_summary": "SPEAKER_1 exercises every Monday and Thursday."}

OUTPUT ACTION:
Merge(0, SPEAKER_1 exercises every Monday and Thursday, although he doesn't particularly enjoy it.)

Task: Follow the example format above to update the personal history for the given case.
INPUT:
* History Personal Summaries:
  – )";

constexpr const char *kExtractionTemplate =
    R"(Task Description: Given a session of dialogue between SPEAKER_1 and SPEAKER_2, extract the
personal summaries of SPEAKER_1, with references to the corresponding turn IDs. Ensure
the output adheres to the following rules:

* Output results in JSON format. The top-level key is "extracted_memories". The value
  should be a list of dictionaries, where each dictionary has the keys "summary" and
  "reference":
  – summary: A concise personal summary, which captures relevant information about
    SPEAKER_1's experiences, preferences, and background, across multiple turns.
  – reference: A list of references, each in the format of [turn_id] indicating
    where the information appears.
* If no personal summary can be extracted, return NO_TRAIT.

Example:
INPUT:
* Turn 0:
  – SPEAKER_1: Did you check out that new gym in town?
  – SPEAKER_2: Yeah, I did. I'm not sure I like the vibe there, though.
* Turn 1:
  – SPEAKER_1: What was wrong with it?
  – SPEAKER_2: The folks there seemed to care more about how they looked than working
    out. It was a little too trendy for me. I'm pretty plain.
* Turn 2:
  – SPEAKER_1: I usually just lift weights there, to be honest. But I think I've
    heard good things about the NordicTrack?
  – SPEAKER_2: Yeah, I've heard good things about that, too.

OUTPUT:
{
  "extracted_memories": [
    {
      "summary": "SPEAKER_1 asked about a new gym in town.",
      "reference": [0]
    },
    {
      "summary": "SPEAKER_1 usually lifts weights at the gym and has heard good things about the NordicTrack.",
      "reference": [2]
    }
  ]
}

Task: Follow the JSON format demonstrated in the example above and extract the personal
summaries for SPEAKER_1 from the following dialogue session.
Input: )";

constexpr const char *kCitationTemplate =
    R"(Task Description: Given a user query and a list of memories consisting of personal
summaries with their corresponding original turns, generate a natural and fluent response
while adhering to the following guidelines:

* Cite useful memories using [i], where i corresponds to the index of the cited memory.
* Do not cite memories that are not useful. If no useful memory exist, output [NO_CITE].
* Each memory is independent and may repeat or contradict others. The response must
  be directly supported by cited memories.
* If the response relies on multiple memories, list all corresponding indices, e.g.,
  [i, j, k].
* The citation is evaluated based on whether the response references the original turns,
  not the summaries.

Examples:
Case 1: Useful Memories Found
INPUT:
* User Query: SPEAKER_1: What hobbies do I enjoy?
* Memories:
  – Memory [0]: SPEAKER_1 enjoys hiking and often goes on weekend trips.
    * Speaker 1: I love spending my weekends hiking in the mountains.
  – Memory [1]: SPEAKER_1 plays the guitar and occasionally performs at open mics.
    * Speaker 1: I've been practicing guitar for years and love playing at open mics.

Output: You enjoy hiking and playing guitar. [0, 1]

Case 2: No Useful Memories
INPUT:
* User Query: SPEAKER_1: What countries did I go to last summer?
* Memories:
  – Memory [0]: SPEAKER_1 enjoys hiking and often goes on weekend trips.
    * Speaker 1: I love spending my weekends hiking in the mountains.

Output: I don't have enough information to answer that. [NO_CITE]

Additional Instructions:
* Ensure the response is fluent and directly answers the user's query.
* Always cite the useful memory indices explicitly.
* Follow the format of the examples provided above.

Input:
* User Query: )";

std::string json_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << common::json_quote(values[i]);
  }
  out << ']';
  return out.str();
}

} // namespace

std::string update_memory_prompt(const std::vector<std::string> &history_summaries,
                                 const std::string &new_summary) {
  std::ostringstream prompt;
  prompt << kUpdateMemoryTemplate;
  prompt << "{\"history_summaries\": " << json_string_array(history_summaries) << "}\n";
  prompt << "* New Personal Summary:\n";
  prompt << "  – {\"new_summary\": " << common::json_quote(new_summary) << "}\n\n";
  prompt << "OUTPUT ACTION:\n";
  return prompt.str();
}

std::string extraction_prompt(const std::string &dialogue_session) {
  return std::string(kExtractionTemplate) + dialogue_session + "\nOutput:\n";
}

std::string citation_prompt(const std::string &user_query, const std::string &memories_block) {
  return std::string(kCitationTemplate) + user_query + "\n* Memories: " + memories_block +
         "\n\nOutput:\n";
}

std::string escape_xml(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::string format_memories_block(const std::vector<RetrievedMemory> &memories) {
  if (memories.empty()) {
    return "";
  }

  std::ostringstream block;
  block << "<memories>\n";
  for (std::size_t i = 0; i < memories.size(); ++i) {
    const auto &memory = memories[i].memory;
    block << "– Memory [" << i << "]: " << escape_xml(memory.topic_summary);
    if (!memory.raw_dialogue.empty()) {
      std::string dialogue = memory.raw_dialogue;
      for (char &ch : dialogue) {
        if (ch == '\n') {
          ch = ' ';
        }
      }
      block << "\n    " << escape_xml(dialogue);
    }
    block << "\n";
  }
  block << "</memories>";
  return block.str();
}

} // namespace rmm::memory
