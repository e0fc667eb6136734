#include "util/jsonl.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"

#include <cmath>
#include <stdexcept>

namespace {
using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;
using google::protobuf::Struct;
using google::protobuf::Value;

google::protobuf::util::JsonParseOptions ParseOptions() {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  options.case_insensitive_enum_parsing = true;
  return options;
}

std::string NumberText(double number) {
  if (std::trunc(number) == number && std::fabs(number) < 9007199254740992.0) {
    return std::to_string(static_cast<int64_t>(number));
  }
  return absl::StrCat(number);
}

// Replaces the numbers stored in string fields with their decimal text.
// Returns whether anything was replaced.
bool NumbersToText(const Descriptor* descriptor, Struct* object) {
  bool changed = false;
  for (auto& entry : *object->mutable_fields()) {
    const FieldDescriptor* field = descriptor->FindFieldByName(entry.first);
    if (field == nullptr) field = descriptor->FindFieldByJsonName(entry.first);
    if (field == nullptr || field->is_repeated()) continue;
    Value* value = &entry.second;
    if (field->type() == FieldDescriptor::TYPE_STRING &&
        value->kind_case() == Value::kNumberValue) {
      value->set_string_value(NumberText(value->number_value()));
      changed = true;
    } else if (field->type() == FieldDescriptor::TYPE_MESSAGE &&
               value->kind_case() == Value::kStructValue) {
      changed |= NumbersToText(field->message_type(),
                               value->mutable_struct_value());
    }
  }
  return changed;
}

// Integer ids written by other tools arrive as JSON numbers, which the proto3
// mapping rejects for string fields.
bool ParseWithNumericIds(const std::string& line,
                         google::protobuf::Message* message) {
  Struct object;
  if (!google::protobuf::util::JsonStringToMessage(line, &object).ok()) {
    return false;
  }
  if (!NumbersToText(message->GetDescriptor(), &object)) return false;
  std::string fixed;
  if (!google::protobuf::util::MessageToJsonString(object, &fixed).ok()) {
    return false;
  }
  message->Clear();
  return google::protobuf::util::JsonStringToMessage(fixed, message,
                                                     ParseOptions())
      .ok();
}
}  // namespace

namespace util {

std::string ToJsonLine(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string line;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &line, options);
  if (!status.ok()) {
    throw std::runtime_error("Cannot serialize " +
                             message.GetDescriptor()->full_name() + ": " +
                             status.ToString());
  }
  line += '\n';
  return line;
}

bool FromJsonLine(const std::string& line, google::protobuf::Message* message,
                  std::string* error_msg) {
  auto status =
      google::protobuf::util::JsonStringToMessage(line, message, ParseOptions());
  if (status.ok()) return true;
  if (ParseWithNumericIds(line, message)) return true;
  *error_msg = status.ToString();
  return false;
}

void AppendJsonl(const std::string& path,
                 const google::protobuf::Message& message) {
  File::Append(path, ToJsonLine(message));
}

std::vector<std::string> JsonlLines(const std::string& content) {
  std::vector<std::string> lines;
  for (absl::string_view line : absl::StrSplit(content, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) continue;
    lines.emplace_back(line);
  }
  return lines;
}

}  // namespace util
