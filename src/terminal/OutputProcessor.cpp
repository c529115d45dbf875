#include "OutputProcessor.hpp"

#include "SpecterErrors.hpp"

namespace specter {
namespace {
const std::regex& ansiRegex() {
  static const std::regex re("\x1b\\[[0-9;?]*[a-zA-Z]");
  return re;
}

// A CSI sequence cut off at the end of a read.
const std::regex& partialAnsiRegex() {
  static const std::regex re("\x1b(\\[[0-9;?]*)?$");
  return re;
}

const std::regex& progressRegex() {
  static const std::regex re = [] {
    static const char* GLYPHS[] = {
        "▌", "▍", "▎", "▏", "█", "░", "▒", "▓", "■", "□", "▪", "▫",
        "●", "○", "◐", "◑", "◒", "◓", "◔", "◕", "◖", "◗", "◘", "◙",
        "◚", "◛", "◜", "◝", "◞", "◟", "◠", "◡", "◢", "◣", "◤", "◥",
        "◦", "◧", "◨", "◩", "◪", "◫", "◬", "◭", "◮", "◯"};
    // Multi-byte glyphs cannot live in a bracket expression of a byte regex,
    // so they become an alternation.
    string glyphs;
    for (const char* glyph : GLYPHS) {
      if (!glyphs.empty()) glyphs += "|";
      glyphs += glyph;
    }
    return std::regex("(?:" + glyphs + ")+|[0-9]+%|\\[[=>\\-\\s]*\\]");
  }();
  return re;
}

const char* PROGRESS_KEYWORDS[] = {"downloading", "installing", "loading",
                                   "progress"};

string normalizeLineEndings(string s) {
  replaceAll(s, "\r\n", "\n");
  std::replace(s.begin(), s.end(), '\r', '\n');
  return s;
}

bool isTrailingSpace(char c) {
  return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

// Trims every newline-terminated line. The unterminated tail is only trimmed
// when `trimTail` is set because more of that line may still arrive.
string trimLines(const string& s, bool trimTail) {
  string out;
  out.reserve(s.size());
  size_t start = 0;
  while (true) {
    size_t newline = s.find('\n', start);
    size_t end = (newline == string::npos) ? s.size() : newline;
    if (newline != string::npos || trimTail) {
      while (end > start && isTrailingSpace(s[end - 1])) {
        end--;
      }
    }
    out.append(s, start, end - start);
    if (newline == string::npos) {
      break;
    }
    out.push_back('\n');
    start = newline + 1;
  }
  return out;
}

bool isOutputFrame(const Frame& frame) {
  return frame.getType() == FrameType::STDOUT ||
         frame.getType() == FrameType::STDERR;
}
}  // namespace

string tokenModeToString(TokenMode mode) {
  switch (mode) {
    case TokenMode::RAW:
      return "raw";
    case TokenMode::COMPACT:
      return "compact";
    case TokenMode::PARSED:
      return "parsed";
  }
  return "unknown";
}

TokenMode tokenModeFromString(const string& name) {
  if (name == "raw") return TokenMode::RAW;
  if (name == "compact") return TokenMode::COMPACT;
  if (name == "parsed") return TokenMode::PARSED;
  throw ConfigurationError("Invalid token mode '" + name +
                           "' (expected raw, compact or parsed)");
}

OutputProcessor::OutputProcessor(TokenMode _mode,
                                 shared_ptr<PromptMatcher> _promptMatcher)
    : mode(_mode),
      promptMatcher(_promptMatcher),
      bufferPromptReported(false) {}

vector<Frame> OutputProcessor::processFrame(const Frame& frame) {
  switch (mode) {
    case TokenMode::RAW:
      return {frame};
    case TokenMode::COMPACT:
      return processCompact(frame);
    case TokenMode::PARSED:
      return processParsed(frame);
  }
  return {frame};
}

string OutputProcessor::stripAnsi(const string& data) {
  string s = data;
  // Removing one sequence can splice together another, so repeat until the
  // text is stable.
  while (std::regex_search(s, ansiRegex())) {
    s = std::regex_replace(s, ansiRegex(), "");
  }
  return s;
}

string OutputProcessor::cleanOutput(const string& data) {
  return trimLines(normalizeLineEndings(stripAnsi(data)), true);
}

bool OutputProcessor::isProgressUpdate(const string& cleaned,
                                       int carriageReturns) {
  if (carriageReturns > 2) {
    return true;
  }
  for (const char* keyword : PROGRESS_KEYWORDS) {
    if (cleaned.find(keyword) != string::npos) {
      return true;
    }
  }
  return std::regex_search(cleaned, progressRegex());
}

vector<Frame> OutputProcessor::processCompact(const Frame& frame) {
  switch (frame.getType()) {
    case FrameType::STDOUT:
    case FrameType::STDERR:
      break;
    case FrameType::EXIT:
    case FrameType::SIGNAL:
    case FrameType::CAPSULE_KILL: {
      // The trailing partial line belongs before the end of the session.
      vector<Frame> out = flush();
      out.push_back(frame);
      return out;
    }
    default:
      return {frame};
  }

  if (!frame.getData() || frame.isBinary()) {
    return {frame};
  }

  string payload = pendingEscape + *frame.getData();
  pendingEscape.clear();
  std::smatch partial;
  if (std::regex_search(payload, partial, partialAnsiRegex())) {
    pendingEscape = partial.str();
    payload.erase(partial.position(0));
  }

  string stripped = stripAnsi(payload);
  int carriageReturns = std::count(stripped.begin(), stripped.end(), '\r');
  string normalized = normalizeLineEndings(stripped);
  string cleaned = trimLines(normalized, true);

  if (isProgressUpdate(cleaned, carriageReturns)) {
    // Text that came before the progress line goes out first.
    vector<Frame> out = takeLineBuffer();
    auto update = handleProgressUpdate(frame, cleaned);
    out.insert(out.end(), update.begin(), update.end());
    return out;
  }

  lineBuffer.append(normalized);
  if (normalized.find('\n') != string::npos ||
      lineBuffer.size() > LINE_BUFFER_THRESHOLD) {
    Frame out = Frame(frame.getType(), frame.getTimestamp())
                    .withData(trimLines(lineBuffer, false));
    lineBuffer.clear();
    bufferPromptReported = false;
    return {out};
  }
  return {};
}

vector<Frame> OutputProcessor::handleProgressUpdate(const Frame& frame,
                                                    const string& cleaned) {
  string text = cleaned;
  while (!text.empty() && text.back() == '\n') {
    text.pop_back();
  }
  if (text.empty()) {
    return {};
  }
  if (lastLineUpdate && *lastLineUpdate == text) {
    VLOG(3) << "Skipping duplicate progress update";
    return {};
  }
  lastLineUpdate = text;
  return {Frame(FrameType::LINE_UPDATE, frame.getTimestamp()).withData(text)};
}

vector<Frame> OutputProcessor::processParsed(const Frame& frame) {
  // A partial line that already produced a prompt must not produce it again
  // once the rest of the line arrives.
  bool skipFirstLine = bufferPromptReported;
  vector<Frame> compact = processCompact(frame);
  if (!promptMatcher || promptMatcher->empty()) {
    return compact;
  }

  vector<Frame> out;
  for (const auto& it : compact) {
    out.push_back(it);
    if (isOutputFrame(it) && it.getData()) {
      matchPrompts(it, skipFirstLine, &out);
      skipFirstLine = false;
    }
  }

  // Prompts rarely end with a newline, so the pending partial line is
  // checked as well, once.
  if (!bufferPromptReported && !lineBuffer.empty()) {
    auto pattern = promptMatcher->match(lineBuffer);
    if (pattern) {
      out.push_back(Frame(FrameType::PROMPT, frame.getTimestamp())
                        .withData(lineBuffer)
                        .withRegex(*pattern));
      bufferPromptReported = true;
    }
  }
  return out;
}

void OutputProcessor::matchPrompts(const Frame& frame, bool skipFirstLine,
                                   vector<Frame>* out) {
  auto lines = split(*frame.getData(), '\n');
  for (size_t a = 0; a < lines.size(); a++) {
    if (a == 0 && skipFirstLine) {
      continue;
    }
    if (lines[a].empty()) {
      continue;
    }
    auto pattern = promptMatcher->match(lines[a]);
    if (pattern) {
      out->push_back(Frame(FrameType::PROMPT, frame.getTimestamp())
                         .withData(lines[a])
                         .withRegex(*pattern));
    }
  }
}

vector<Frame> OutputProcessor::takeLineBuffer() {
  vector<Frame> frames;
  if (!lineBuffer.empty()) {
    string text = trimLines(lineBuffer, true);
    if (!text.empty()) {
      frames.push_back(Frame(FrameType::STDOUT).withData(text));
    }
    lineBuffer.clear();
  }
  bufferPromptReported = false;
  return frames;
}

vector<Frame> OutputProcessor::flush() {
  if (!pendingEscape.empty()) {
    VLOG(2) << "Dropping unterminated escape sequence";
    pendingEscape.clear();
  }
  return takeLineBuffer();
}
}  // namespace specter
