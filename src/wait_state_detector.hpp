#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

enum class WaitType { ToolApproval, PlanApproval, ClarifyingQuestion, AwaitingResponse };
enum class ApprovalModel { None, Numbered, YesNo, Arrow };
enum class CliType { Claude, Codex, Gemini, OpenCode, Terminal };

const char* wait_type_name(WaitType type);
const char* approval_model_name(ApprovalModel model);
const char* cli_type_name(CliType type);
const char* cli_label(CliType type);
ApprovalModel default_approval_model(CliType type);

struct WaitEvent {
  WaitType wait_type = WaitType::AwaitingResponse;
  ApprovalModel approval_model = ApprovalModel::None;
  std::string prompt;
  // the lines the grammar matched, question line onwards
  std::vector<std::string> context;
  uint64_t prompt_hash = 0;
};

// Removes escape sequences and control bytes, folds carriage returns into
// newlines, collapses runs of spaces and drops blank lines.
std::string strip_ansi_and_normalize(std::string_view raw);

// Grammars see the trailing lines of the normalized buffer.
struct ClaudeGrammar {
  std::optional<WaitEvent> match(const std::vector<std::string>& lines, CliType cli) const;
};

struct CodexGrammar {
  std::optional<WaitEvent> match(const std::vector<std::string>& lines, CliType cli) const;
};

struct GeminiGrammar {
  std::optional<WaitEvent> match(const std::vector<std::string>& lines, CliType cli) const;
};

struct YesNoGrammar {
  std::optional<WaitEvent> match(const std::vector<std::string>& lines, CliType cli) const;
};

// Only for assistants; a shell prompt ending in '?' is not a question.
struct QuestionGrammar {
  std::optional<WaitEvent> match(const std::vector<std::string>& lines, CliType cli) const;
};

using WaitGrammar = std::variant<ClaudeGrammar, CodexGrammar, GeminiGrammar, YesNoGrammar, QuestionGrammar>;

// Evaluated in order; the first match wins.
const std::vector<WaitGrammar>& wait_grammars();

std::optional<WaitEvent> detect_wait_event(const std::string& normalized_buffer, CliType cli);

class CliTracker {
public:
  void update_from_command(const std::string& command);
  void update_from_output(std::string_view normalized);
  CliType current() const { return current_; }

private:
  CliType current_ = CliType::Terminal;
};

enum class DetectorState { Running, Waiting, Ended };

struct WaitTransition {
  enum class Kind { Waiting, Cleared, Ended };
  Kind kind;
  std::optional<WaitEvent> event;
};

// One per session. Not thread safe; the owner serializes calls.
class WaitStateDetector {
public:
  static constexpr std::size_t kBufferMaxChars = 4000;
  static constexpr std::size_t kClearThresholdChars = 10;

  explicit WaitStateDetector(const std::string& command = std::string());

  std::optional<WaitTransition> feed(std::string_view raw_chunk);
  std::optional<WaitTransition> on_user_input();
  WaitTransition on_exit();

  DetectorState state() const { return state_; }
  const std::optional<WaitEvent>& current_wait() const { return current_; }
  CliType cli_type() const { return tracker_.current(); }
  ApprovalModel approval_model() const;
  const std::string& buffer() const { return buffer_; }

private:
  bool is_redraw_of_current(const std::string& normalized) const;

  std::string buffer_;
  DetectorState state_ = DetectorState::Running;
  std::optional<WaitEvent> current_;
  CliTracker tracker_;
};

// Keystrokes that answer a prompt: response is yes, yes_always or no.
std::optional<std::string> approval_input_for(ApprovalModel model, const std::string& response);

// {title, body} for a push notification.
std::pair<std::string, std::string> build_notification_text(CliType cli,
                                                            const std::string& session_name,
                                                            const WaitEvent& event);
