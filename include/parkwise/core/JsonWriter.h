#pragma once

#include <cmath>
#include <cstdio>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace parkwise::core {

// Streaming JSON writer for tool output.
//
//   JsonWriter j(std::cout, /*pretty=*/true);
//   j.beginObject();
//   j.key("total"); j.value(12);
//   j.endObject();
//
// The writer does not validate structure beyond comma/indent bookkeeping.
// Non-finite doubles are written as null.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = false) : out_(out), pretty_(pretty) {}

  void beginObject() { open('{'); }
  void endObject() { close('}'); }
  void beginArray() { open('['); }
  void endArray() { close(']'); }

  void key(std::string_view k) {
    separate();
    writeString(k);
    out_ << (pretty_ ? ": " : ":");
    afterKey_ = true;
  }

  void value(std::string_view v) { separate(); writeString(v); }
  void value(const char* v) { value(std::string_view(v ? v : "")); }
  void value(const std::string& v) { value(std::string_view(v)); }
  void value(bool v) { separate(); out_ << (v ? "true" : "false"); }
  void value(int v) { separate(); out_ << v; }
  void value(long long v) { separate(); out_ << v; }
  void value(unsigned long long v) { separate(); out_ << v; }

  void value(double v) {
    separate();
    if (!std::isfinite(v)) {
      out_ << "null";
      return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", v);
    out_ << buf;
  }

  void nullValue() { separate(); out_ << "null"; }

private:
  struct Level {
    bool first{true};
  };

  void open(char c) {
    separate();
    out_ << c;
    stack_.push_back(Level{});
  }

  void close(char c) {
    const bool empty = stack_.empty() || stack_.back().first;
    if (!stack_.empty()) stack_.pop_back();
    if (pretty_ && !empty) newline();
    out_ << c;
    if (stack_.empty() && pretty_) out_ << "\n";
  }

  // Emits the comma/newline that precedes a value or key at the current level.
  void separate() {
    if (afterKey_) {
      afterKey_ = false;
      return;
    }
    if (stack_.empty()) return;
    if (!stack_.back().first) out_ << ',';
    stack_.back().first = false;
    if (pretty_) newline();
  }

  void newline() {
    out_ << '\n';
    for (std::size_t i = 0; i < stack_.size(); ++i) out_ << "  ";
  }

  void writeString(std::string_view s) {
    out_ << '"';
    for (char c : s) {
      switch (c) {
        case '"': out_ << "\\\""; break;
        case '\\': out_ << "\\\\"; break;
        case '\n': out_ << "\\n"; break;
        case '\r': out_ << "\\r"; break;
        case '\t': out_ << "\\t"; break;
        default:
          if ((unsigned char)c < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
            out_ << buf;
          } else {
            out_ << c;
          }
          break;
      }
    }
    out_ << '"';
  }

  std::ostream& out_;
  bool pretty_{false};
  bool afterKey_{false};
  std::vector<Level> stack_;
};

} // namespace parkwise::core
