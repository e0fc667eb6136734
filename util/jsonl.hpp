#ifndef UTIL_JSONL_HPP
#define UTIL_JSONL_HPP

#include <string>
#include <vector>

#include "glog/logging.h"
#include "google/protobuf/message.h"
#include "util/file.hpp"

namespace util {

// Serializes a message as a single line of JSON, using the original proto
// field names and printing fields with default values.
std::string ToJsonLine(const google::protobuf::Message& message);

// Parses one JSON object into message. Returns false and sets error_msg if
// the line is not a valid representation of the message.
bool FromJsonLine(const std::string& line, google::protobuf::Message* message,
                  std::string* error_msg);

// Appends a message to a JSON-lines file.
void AppendJsonl(const std::string& path,
                 const google::protobuf::Message& message);

// Appends several messages with a single write.
template <typename T>
void AppendJsonl(const std::string& path, const std::vector<T>& messages) {
  std::string buffer;
  for (const T& message : messages) buffer += ToJsonLine(message);
  File::Append(path, buffer);
}

// Splits a JSON-lines document in its non-blank lines.
std::vector<std::string> JsonlLines(const std::string& content);

// Reads all the messages stored in a JSON-lines file. Lines that cannot be
// parsed are logged and skipped. Throws file_not_found if path is missing.
template <typename T>
std::vector<T> ReadJsonl(const std::string& path) {
  std::vector<T> messages;
  size_t line_number = 0;
  for (const std::string& line : JsonlLines(File::Read(path))) {
    line_number++;
    T message;
    std::string error_msg;
    if (!FromJsonLine(line, &message, &error_msg)) {
      LOG(WARNING) << path << ":" << line_number << ": " << error_msg;
      continue;
    }
    messages.push_back(std::move(message));
  }
  return messages;
}

}  // namespace util

#endif
