#include "CommandMarkers.hpp"

namespace rt {
namespace {
const size_t MAX_STATUS_DIGITS = 9;
}

MarkerCommand CommandMarkers::wrap(const string& command, const string& id) {
  MarkerCommand marker;
  marker.id = id;
  marker.command = command;
  marker.startMarker = "<<CMD:" + id + ":START>>";
  marker.endMarkerPrefix = "<<CMD:" + id + ":END:";
  marker.wrapped = "printf \"\\n" + marker.startMarker + "\\n\"; " + command +
                   "; printf \"\\n" + marker.endMarkerPrefix +
                   "%d>>\\n\" $?\n";
  return marker;
}

bool CommandMarkers::isEchoedMarker(const string& buffer, size_t pos) {
  // The shell echo shows the marker right after the literal "\n" of the
  // printf format, the real output puts it after a newline.
  return pos >= 2 && buffer[pos - 1] == 'n' && buffer[pos - 2] == '\\';
}

CommandMarkers::Scan CommandMarkers::scan(const string& buffer,
                                          const MarkerCommand& marker) {
  Scan result;
  size_t pos = 0;
  while ((pos = buffer.find(marker.endMarkerPrefix, pos)) != string::npos) {
    size_t digits = pos + marker.endMarkerPrefix.length();
    size_t p = digits;
    if (p < buffer.length() && buffer[p] == '-') {
      p++;
    }
    size_t firstDigit = p;
    while (p < buffer.length() && isdigit((unsigned char)buffer[p])) {
      p++;
    }
    // Statuses wider than an int are not sentinels we wrote
    size_t digitCount = p - firstDigit;
    if (digitCount > 0 && digitCount <= MAX_STATUS_DIGITS &&
        buffer.compare(p, 2, ">>") == 0) {
      result.sawEnd = true;
      result.endPos = pos;
      result.exitCode = stoi(buffer.substr(digits, p - digits));
      break;
    }
    pos++;
  }

  size_t searchFrom =
      result.sawEnd ? result.endPos : buffer.length();
  size_t start = searchFrom;
  while (start > 0) {
    start = buffer.rfind(marker.startMarker, start - 1);
    if (start == string::npos) {
      break;
    }
    if (!isEchoedMarker(buffer, start)) {
      result.sawStart = true;
      result.startPos = start;
      break;
    }
  }
  return result;
}

bool CommandMarkers::isPromptLine(const string& line) {
  string stripped = trimWhitespace(line);
  if (stripped.empty()) {
    return false;
  }
  char last = stripped.back();
  if (last != '$' && last != '#' && last != '>') {
    return false;
  }
  return stripped.find('@') != string::npos ||
         stripped.find(':') != string::npos;
}

string CommandMarkers::stripTerminalEscapes(const string& data) {
  string out;
  out.reserve(data.length());
  size_t i = 0;
  while (i < data.length()) {
    if (data[i] != '\x1b' || i + 1 >= data.length()) {
      out.push_back(data[i]);
      i++;
      continue;
    }
    char kind = data[i + 1];
    if (kind == '[') {
      // CSI: parameters then one final letter
      size_t j = i + 2;
      while (j < data.length() &&
             (isdigit((unsigned char)data[j]) || data[j] == ';' ||
              data[j] == '?')) {
        j++;
      }
      i = (j < data.length()) ? j + 1 : j;
    } else if (kind == ']') {
      // OSC: ends with BEL or ESC backslash
      size_t j = i + 2;
      while (j < data.length() && data[j] != '\x07' && data[j] != '\x1b') {
        j++;
      }
      if (j < data.length() && data[j] == '\x1b') {
        j++;
      }
      i = (j < data.length()) ? j + 1 : j;
    } else {
      i += 2;
    }
  }
  return out;
}

string CommandMarkers::extractOutput(const string& buffer,
                                     const MarkerCommand& marker,
                                     const Scan& scan) {
  if (!scan.sawEnd || !scan.sawStart || scan.startPos >= scan.endPos) {
    return "";
  }
  size_t contentStart =
      buffer.find('\n', scan.startPos + marker.startMarker.length());
  if (contentStart == string::npos || contentStart > scan.endPos) {
    contentStart = scan.startPos + marker.startMarker.length();
  } else {
    contentStart++;
  }
  string content = buffer.substr(contentStart, scan.endPos - contentStart);
  content = stripTerminalEscapes(content);
  replaceAll(content, "\r", "");

  vector<string> kept;
  for (const auto& line : split(content, '\n')) {
    if (line.find("<<CMD:") != string::npos) {
      continue;
    }
    if (isPromptLine(line)) {
      continue;
    }
    kept.push_back(line);
  }
  while (!kept.empty() && trimWhitespace(kept.front()).empty()) {
    kept.erase(kept.begin());
  }
  while (!kept.empty() && trimWhitespace(kept.back()).empty()) {
    kept.pop_back();
  }

  string output;
  for (size_t i = 0; i < kept.size(); i++) {
    if (i) {
      output += "\n";
    }
    output += kept[i];
  }
  return output;
}
}  // namespace rt
