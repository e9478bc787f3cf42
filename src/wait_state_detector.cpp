#include "wait_state_detector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

namespace {

std::string to_lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return out;
}

bool contains_ci(std::string_view hay, std::string_view needle) {
  return to_lower(hay).find(to_lower(needle)) != std::string::npos;
}

// True when word occurs with no letter or digit on either side.
bool contains_word_ci(std::string_view hay, std::string_view word) {
  const auto lower = to_lower(hay);
  const auto needle = to_lower(word);
  for(auto pos = lower.find(needle); pos != std::string::npos; pos = lower.find(needle, pos + 1)) {
    const std::size_t end = pos + needle.size();
    bool left = pos == 0 || !std::isalnum(static_cast<unsigned char>(lower[pos - 1]));
    bool right = end == lower.size() || !std::isalnum(static_cast<unsigned char>(lower[end]));
    if(left && right) return true;
  }
  return false;
}

bool starts_with_ci(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && to_lower(value.substr(0, prefix.size())) == to_lower(prefix);
}

bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_space(char ch) {
  return ch == ' ' || ch == '\t';
}

std::size_t count_code_points(std::string_view s) {
  return static_cast<std::size_t>(std::count_if(s.begin(), s.end(),
    [](char ch){ return (static_cast<unsigned char>(ch) & 0xc0) != 0x80; }));
}

std::string trim(std::string_view s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while(b < e && (is_space(s[b]) || s[b] == '\n')) ++b;
  while(e > b && (is_space(s[e - 1]) || s[e - 1] == '\n')) --e;
  return std::string(s.substr(b, e - b));
}

// Box drawing, selection markers and bullets that TUIs wrap around prompts.
const std::array<std::string_view, 14>& decorations() {
  static const std::array<std::string_view, 14> marks = {
    " ", "\t", ">", "*",
    "\xe2\x94\x82",  // │
    "\xe2\x94\x83",  // ┃
    "\xe2\x95\xad",  // ╭
    "\xe2\x95\xb0",  // ╰
    "\xe2\x94\x80",  // ─
    "\xe2\x9d\xaf",  // ❯
    "\xe2\x80\xba",  // ›
    "\xe2\x96\x8c",  // ▌
    "\xe2\x97\x8f",  // ●
    "\xe2\x97\x8b"   // ○
  };
  return marks;
}

std::string strip_decor(std::string_view line) {
  bool changed = true;
  while(changed && !line.empty()) {
    changed = false;
    for(auto mark : decorations()) {
      if(line.substr(0, mark.size()) == mark) {
        line.remove_prefix(mark.size());
        changed = true;
      }
      if(ends_with(line, mark) && mark != ">" && mark != "*") {
        line.remove_suffix(mark.size());
        changed = true;
      }
    }
  }
  return std::string(line);
}

std::vector<std::string> tail_lines(const std::string& buffer, std::size_t max_lines) {
  std::vector<std::string> lines;
  std::size_t end = buffer.size();
  while(end > 0 && lines.size() < max_lines) {
    auto nl = buffer.rfind('\n', end - 1);
    std::size_t begin = nl == std::string::npos ? 0 : nl + 1;
    if(end > begin) lines.push_back(buffer.substr(begin, end - begin));
    if(nl == std::string::npos) break;
    end = nl;
  }
  std::reverse(lines.begin(), lines.end());
  return lines;
}

uint64_t fnv1a(std::string_view data, uint64_t hash = 1469598103934665603ull) {
  for(unsigned char ch : data) {
    hash ^= ch;
    hash *= 1099511628211ull;
  }
  return hash;
}

WaitEvent make_event(WaitType type,
                     ApprovalModel model,
                     const std::vector<std::string>& lines,
                     std::size_t question_index) {
  WaitEvent ev;
  ev.wait_type = type;
  ev.approval_model = model;
  ev.prompt = strip_decor(lines[question_index]);
  for(std::size_t i = question_index; i < lines.size(); ++i) {
    auto stripped = strip_decor(lines[i]);
    if(!stripped.empty()) ev.context.push_back(std::move(stripped));
  }
  return ev;
}

// Index of the last line satisfying pred, searching from the bottom.
template<typename Pred>
std::optional<std::size_t> find_last(const std::vector<std::string>& lines, Pred pred) {
  for(std::size_t i = lines.size(); i > 0; --i) {
    if(pred(strip_decor(lines[i - 1]))) return i - 1;
  }
  return std::nullopt;
}

template<typename Pred>
bool any_after(const std::vector<std::string>& lines, std::size_t index, Pred pred) {
  for(std::size_t i = index + 1; i < lines.size(); ++i) {
    if(pred(lines[i])) return true;
  }
  return false;
}

bool is_numbered_yes(const std::string& raw_line) {
  auto s = strip_decor(raw_line);
  return starts_with_ci(s, "1. yes") || starts_with_ci(s, "1.yes");
}

} // namespace

const char* wait_type_name(WaitType type) {
  switch(type) {
    case WaitType::ToolApproval: return "tool_approval";
    case WaitType::PlanApproval: return "plan_approval";
    case WaitType::ClarifyingQuestion: return "clarifying_question";
    case WaitType::AwaitingResponse: return "awaiting_response";
  }
  return "awaiting_response";
}

const char* approval_model_name(ApprovalModel model) {
  switch(model) {
    case ApprovalModel::Numbered: return "numbered";
    case ApprovalModel::YesNo: return "yes_no";
    case ApprovalModel::Arrow: return "arrow";
    case ApprovalModel::None: return "none";
  }
  return "none";
}

const char* cli_type_name(CliType type) {
  switch(type) {
    case CliType::Claude: return "claude";
    case CliType::Codex: return "codex";
    case CliType::Gemini: return "gemini";
    case CliType::OpenCode: return "opencode";
    case CliType::Terminal: return "terminal";
  }
  return "terminal";
}

const char* cli_label(CliType type) {
  switch(type) {
    case CliType::Claude: return "Claude";
    case CliType::Codex: return "Codex";
    case CliType::Gemini: return "Gemini";
    case CliType::OpenCode: return "OpenCode";
    case CliType::Terminal: return "CLI";
  }
  return "CLI";
}

ApprovalModel default_approval_model(CliType type) {
  switch(type) {
    case CliType::Claude:
    case CliType::Gemini:
    case CliType::OpenCode:
      return ApprovalModel::Numbered;
    case CliType::Codex:
      return ApprovalModel::Arrow;
    case CliType::Terminal:
      return ApprovalModel::None;
  }
  return ApprovalModel::None;
}

std::string strip_ansi_and_normalize(std::string_view raw) {
  std::string cleaned;
  cleaned.reserve(raw.size());
  const std::size_t n = raw.size();
  for(std::size_t i = 0; i < n; ++i) {
    unsigned char c = static_cast<unsigned char>(raw[i]);
    if(c == 0x1b) {
      if(i + 1 >= n) break;
      char kind = raw[i + 1];
      if(kind == '[') {
        i += 2;
        while(i < n && !(raw[i] >= 0x40 && raw[i] <= 0x7e)) ++i;
      } else if(kind == ']') {
        i += 2;
        while(i < n && raw[i] != '\a' && !(raw[i] == 0x1b && i + 1 < n && raw[i + 1] == '\\')) ++i;
        if(i < n && raw[i] == 0x1b) ++i;
      } else if(std::string_view("()*+#%").find(kind) != std::string_view::npos) {
        i += 2;
      } else {
        i += 1;
      }
      continue;
    }
    if(c == '\r') {
      if(i + 1 < n && raw[i + 1] == '\n') ++i;
      cleaned.push_back('\n');
      continue;
    }
    if(c == '\n') {
      cleaned.push_back('\n');
      continue;
    }
    if(c == '\t') {
      cleaned.push_back(' ');
      continue;
    }
    if(c < 0x20 || c == 0x7f) continue;
    cleaned.push_back(static_cast<char>(c));
  }

  std::string out;
  out.reserve(cleaned.size());
  std::size_t start = 0;
  while(start <= cleaned.size()) {
    auto nl = cleaned.find('\n', start);
    bool terminated = nl != std::string::npos;
    std::string_view line(cleaned.data() + start, (terminated ? nl : cleaned.size()) - start);

    std::string collapsed;
    collapsed.reserve(line.size());
    for(char ch : line) {
      if(ch == ' ' && !collapsed.empty() && collapsed.back() == ' ') continue;
      collapsed.push_back(ch);
    }
    if(collapsed.find_first_not_of(' ') != std::string::npos) {
      out += collapsed;
      if(terminated) out.push_back('\n');
    }
    if(!terminated) break;
    start = nl + 1;
  }
  return out;
}

std::optional<WaitEvent> ClaudeGrammar::match(const std::vector<std::string>& lines, CliType) const {
  auto q = find_last(lines, [](const std::string& s){
    return contains_ci(s, "do you want to") || contains_ci(s, "would you like to");
  });
  if(!q || !any_after(lines, *q, is_numbered_yes)) return std::nullopt;

  // only the question and its menu decide; output above them is arbitrary text
  bool plan = std::any_of(lines.begin() + static_cast<std::ptrdiff_t>(*q), lines.end(),
                          [](const std::string& l){
                            return contains_word_ci(l, "plan") || contains_word_ci(l, "planning");
                          });
  return make_event(plan ? WaitType::PlanApproval : WaitType::ToolApproval,
                    ApprovalModel::Numbered, lines, *q);
}

std::optional<WaitEvent> CodexGrammar::match(const std::vector<std::string>& lines, CliType) const {
  auto q = find_last(lines, [](const std::string& s){
    return s.find("Allow command?") != std::string::npos || starts_with_ci(s, "approve");
  });
  if(!q) return std::nullopt;
  bool menu = any_after(lines, *q, [](const std::string& raw){
    return raw.find("\xe2\x96\x8c") != std::string::npos || raw.find("\xe2\x80\xba") != std::string::npos;
  });
  if(!menu) return std::nullopt;
  return make_event(WaitType::ToolApproval, ApprovalModel::Arrow, lines, *q);
}

std::optional<WaitEvent> GeminiGrammar::match(const std::vector<std::string>& lines, CliType) const {
  auto q = find_last(lines, [](const std::string& s){
    return s.find("Allow execution") != std::string::npos ||
           s.find("Apply this change?") != std::string::npos;
  });
  if(!q) return std::nullopt;
  bool menu = any_after(lines, *q, [](const std::string& raw){
    return raw.find("\xe2\x97\x8f 1.") != std::string::npos;
  });
  if(!menu) return std::nullopt;
  return make_event(WaitType::ToolApproval, ApprovalModel::Numbered, lines, *q);
}

std::optional<WaitEvent> YesNoGrammar::match(const std::vector<std::string>& lines, CliType cli) const {
  if(lines.empty()) return std::nullopt;
  std::string last = to_lower(strip_decor(lines.back()));
  while(!last.empty() && (last.back() == ' ' || last.back() == ':' || last.back() == '?')) {
    last.pop_back();
  }
  if(!ends_with(last, "(y/n)") && !ends_with(last, "[y/n]") && !ends_with(last, "(yes/no)")) {
    return std::nullopt;
  }
  auto type = cli == CliType::Terminal ? WaitType::AwaitingResponse : WaitType::ToolApproval;
  return make_event(type, ApprovalModel::YesNo, lines, lines.size() - 1);
}

std::optional<WaitEvent> QuestionGrammar::match(const std::vector<std::string>& lines, CliType cli) const {
  if(cli == CliType::Terminal || lines.empty()) return std::nullopt;
  std::string last = strip_decor(lines.back());
  if(last.size() < 10 || last.back() != '?') return std::nullopt;
  return make_event(WaitType::ClarifyingQuestion, ApprovalModel::None, lines, lines.size() - 1);
}

const std::vector<WaitGrammar>& wait_grammars() {
  static const std::vector<WaitGrammar> grammars = {
    ClaudeGrammar{}, CodexGrammar{}, GeminiGrammar{}, YesNoGrammar{}, QuestionGrammar{}
  };
  return grammars;
}

std::optional<WaitEvent> detect_wait_event(const std::string& normalized_buffer, CliType cli) {
  auto lines = tail_lines(normalized_buffer, 15);
  if(lines.empty()) return std::nullopt;
  for(const auto& grammar : wait_grammars()) {
    auto ev = std::visit([&](const auto& g){ return g.match(lines, cli); }, grammar);
    if(!ev) continue;
    uint64_t hash = fnv1a(wait_type_name(ev->wait_type));
    for(const auto& line : ev->context) hash = fnv1a(line, fnv1a("\n", hash));
    ev->prompt_hash = hash;
    return ev;
  }
  return std::nullopt;
}

void CliTracker::update_from_command(const std::string& command) {
  auto base = to_lower(std::filesystem::path(command).filename().string());
  if(base.find("claude") != std::string::npos) current_ = CliType::Claude;
  else if(base.find("codex") != std::string::npos) current_ = CliType::Codex;
  else if(base.find("gemini") != std::string::npos) current_ = CliType::Gemini;
  else if(base.find("opencode") != std::string::npos) current_ = CliType::OpenCode;
  else current_ = CliType::Terminal;
}

void CliTracker::update_from_output(std::string_view normalized) {
  // a shell session may start an assistant later; its banner tells us which
  if(current_ != CliType::Terminal) return;
  if(normalized.find("Claude Code") != std::string_view::npos) current_ = CliType::Claude;
  else if(normalized.find("OpenAI Codex") != std::string_view::npos) current_ = CliType::Codex;
  else if(normalized.find("Gemini CLI") != std::string_view::npos) current_ = CliType::Gemini;
  else if(contains_ci(normalized, "opencode")) current_ = CliType::OpenCode;
}

WaitStateDetector::WaitStateDetector(const std::string& command) {
  if(!command.empty()) tracker_.update_from_command(command);
}

ApprovalModel WaitStateDetector::approval_model() const {
  if(current_) return current_->approval_model;
  return default_approval_model(tracker_.current());
}

bool WaitStateDetector::is_redraw_of_current(const std::string& normalized) const {
  if(!current_) return false;
  std::size_t start = 0;
  bool saw_line = false;
  while(start < normalized.size()) {
    auto nl = normalized.find('\n', start);
    auto line = strip_decor(normalized.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
    if(!line.empty()) {
      saw_line = true;
      bool known = std::any_of(current_->context.begin(), current_->context.end(),
                               [&](const std::string& c){ return c.find(line) != std::string::npos; });
      if(!known) return false;
    }
    if(nl == std::string::npos) break;
    start = nl + 1;
  }
  return saw_line;
}

std::optional<WaitTransition> WaitStateDetector::feed(std::string_view raw_chunk) {
  if(state_ == DetectorState::Ended) return std::nullopt;
  auto normalized = strip_ansi_and_normalize(raw_chunk);
  if(normalized.empty()) return std::nullopt;
  tracker_.update_from_output(normalized);

  if(state_ == DetectorState::Waiting &&
     count_code_points(trim(normalized)) >= kClearThresholdChars &&
     !is_redraw_of_current(normalized) &&
     !detect_wait_event(normalized, tracker_.current())) {
    buffer_ = normalized;
    state_ = DetectorState::Running;
    current_.reset();
    return WaitTransition{WaitTransition::Kind::Cleared, std::nullopt};
  }

  buffer_ += normalized;
  std::size_t chars = count_code_points(buffer_);
  if(chars > kBufferMaxChars) {
    std::size_t drop = chars - kBufferMaxChars;
    std::size_t pos = 0;
    while(pos < buffer_.size() && drop > 0) {
      ++pos;
      while(pos < buffer_.size() && (static_cast<unsigned char>(buffer_[pos]) & 0xc0) == 0x80) ++pos;
      --drop;
    }
    buffer_.erase(0, pos);
  }

  auto ev = detect_wait_event(buffer_, tracker_.current());
  if(!ev) return std::nullopt;
  if(current_ && current_->prompt_hash == ev->prompt_hash && current_->wait_type == ev->wait_type) {
    return std::nullopt;
  }
  current_ = ev;
  state_ = DetectorState::Waiting;
  return WaitTransition{WaitTransition::Kind::Waiting, ev};
}

std::optional<WaitTransition> WaitStateDetector::on_user_input() {
  buffer_.clear();
  if(state_ != DetectorState::Waiting) return std::nullopt;
  state_ = DetectorState::Running;
  current_.reset();
  return WaitTransition{WaitTransition::Kind::Cleared, std::nullopt};
}

WaitTransition WaitStateDetector::on_exit() {
  state_ = DetectorState::Ended;
  current_.reset();
  buffer_.clear();
  return WaitTransition{WaitTransition::Kind::Ended, std::nullopt};
}

std::optional<std::string> approval_input_for(ApprovalModel model, const std::string& response) {
  switch(model) {
    case ApprovalModel::Numbered:
      if(response == "yes") return std::string("1\n");
      if(response == "yes_always") return std::string("2\n");
      if(response == "no") return std::string("3\n");
      return std::nullopt;
    case ApprovalModel::YesNo:
      if(response == "yes" || response == "yes_always") return std::string("y\n");
      if(response == "no") return std::string("n\n");
      return std::nullopt;
    case ApprovalModel::Arrow:
      if(response == "yes") return std::string("\r");
      if(response == "yes_always") return std::string("\x1b[C\r");
      if(response == "no") return std::string("\x1b[C\x1b[C\r");
      return std::nullopt;
    case ApprovalModel::None:
      return std::nullopt;
  }
  return std::nullopt;
}

std::pair<std::string, std::string> build_notification_text(CliType cli,
                                                            const std::string& session_name,
                                                            const WaitEvent& event) {
  const std::string label = cli_label(cli);
  std::string title;
  std::string body;
  switch(event.wait_type) {
    case WaitType::ToolApproval:
      title = "Tool Approval Needed";
      body = label + " needs permission to proceed";
      break;
    case WaitType::PlanApproval:
      title = "Plan Approval Needed";
      body = label + " has a plan ready for review";
      break;
    case WaitType::ClarifyingQuestion: {
      title = "Question from CLI";
      // first 100 code points
      std::size_t pos = 0;
      std::size_t count = 0;
      while(pos < event.prompt.size() && count < 100) {
        ++pos;
        while(pos < event.prompt.size() &&
              (static_cast<unsigned char>(event.prompt[pos]) & 0xc0) == 0x80) ++pos;
        ++count;
      }
      body = label + ": " + event.prompt.substr(0, pos);
      break;
    }
    case WaitType::AwaitingResponse:
      title = "Awaiting Your Response";
      body = label + " is waiting for input";
      break;
  }
  return {session_name + " \xc2\xb7 " + title, body};
}
