#include "internal/line/line_parser.hpp"

#include <cassert>
#include <clocale>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>

using collector::line::Parse;
using collector::line::ParseError;

namespace {

void TestParsesMeasurementTagsAndFields() {
  auto result = Parse("plant,pin=A15 moisture=140,temperature=27.4");
  assert(result);
  assert(result.code == ParseError::OK);

  const auto& record = *result.record;
  assert(record.measurement == "plant");
  assert(record.tags.size() == 1);
  assert(record.tags[0].first == "pin" && record.tags[0].second == "A15");
  assert(record.fields.size() == 2);
  assert(record.fields[0].first == "moisture");
  assert(std::get<double>(record.fields[0].second) == 140.0);
  assert(record.fields[1].first == "temperature");
  assert(std::get<double>(record.fields[1].second) == 27.4);
  assert(!record.timestamp.has_value());
}

void TestParsesAllFieldTypes() {
  auto result = Parse(R"(m a=-5i,b=7u,c=1.5e3,d="hi, there \"x\"",e=T,f=false)");
  assert(result);

  const auto& fields = result.record->fields;
  assert(fields.size() == 6);
  assert(std::get<int64_t>(fields[0].second) == -5);
  assert(std::get<uint64_t>(fields[1].second) == 7u);
  assert(std::get<double>(fields[2].second) == 1500.0);
  assert(std::get<std::string>(fields[3].second) == "hi, there \"x\"");
  assert(std::get<bool>(fields[4].second) == true);
  assert(std::get<bool>(fields[5].second) == false);
}

void TestEscapedNamesAreUnescaped() {
  auto result = Parse(R"(my\ plant,room\=x=a\,b temp\ c=1)");
  assert(result);
  assert(result.record->measurement == "my plant");
  assert(result.record->tags[0].first == "room=x");
  assert(result.record->tags[0].second == "a,b");
  assert(result.record->fields[0].first == "temp c");
}

void TestSpacesInsideStringFieldDoNotSplit() {
  auto result = Parse(R"(log msg="pump on now")");
  assert(result);
  assert(std::get<std::string>(result.record->fields[0].second) == "pump on now");
}

void TestQuotesAreLiteralInTagSection() {
  auto result = Parse(R"(box,size=5" depth=2)");
  assert(result);
  assert(result.record->tags[0].second == "5\"");
  assert(std::get<double>(result.record->fields[0].second) == 2.0);

  // a quoted tag value cannot hide a space
  assert(!Parse(R"(box,t="a b" depth=2)"));
}

void TestFloatsIgnoreLocale() {
  // decimal comma locales must not change how '.' is read
  const char* locales[] = {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8"};
  bool        switched  = false;
  for (const char* name : locales) {
    if (std::setlocale(LC_NUMERIC, name) != nullptr) {
      switched = true;
      break;
    }
  }

  auto result = Parse("plant temperature=27.4,offset=+0.5");
  if (switched) std::setlocale(LC_NUMERIC, "C");

  assert(result);
  assert(std::get<double>(result.record->fields[0].second) == 27.4);
  assert(std::get<double>(result.record->fields[1].second) == 0.5);
}

void TestTrimsCarriageReturnAndWhitespace() {
  auto result = Parse("  plant moisture=1\r\n");
  assert(result);
  assert(result.record->measurement == "plant");
}

void TestRejectsMalformedLines() {
  const char* bad[] = {
      "",
      "   \r",
      "# comment",
      "plant",
      "plant ",
      "plant moisture=1 1700000000000000000",
      ",pin=A15 moisture=1",
      "plant,pin moisture=1",
      "plant,pin= moisture=1",
      "plant,=A15 moisture=1",
      "plant,pin=A15,pin=B2 moisture=1",
      "plant,pin=a=b moisture=1",
      "plant moisture=1,moisture=2",
      "plant =1",
      "plant moisture",
      "plant moisture=",
      "plant moisture=abc",
      "plant moisture=nan",
      "plant moisture=inf",
      "plant moisture=0x10",
      "plant moisture=12.3.4",
      "plant count=99999999999999999999i",
      "plant count=-1u",
      "plant count=1.5i",
      R"(plant msg="open)",
      R"(plant msg="a"b)",
      "plant  moisture=1",
      "plant moisture=+-1",
  };

  for (const char* line : bad) {
    auto result = Parse(line);
    if (result) {
      std::cerr << "accepted malformed line: " << line << "\n";
    }
    assert(!result);
    assert(result.code == ParseError::Malformed);
    assert(!result.message.empty());
    assert(!result.record.has_value());
  }
}

void TestTimestampRejectionExplainsWhy() {
  auto result = Parse("plant moisture=1 1700000000000000000");
  assert(!result);
  assert(result.message.find("timestamp") != std::string::npos);
}

} // namespace

int main() {
  TestParsesMeasurementTagsAndFields();
  TestParsesAllFieldTypes();
  TestEscapedNamesAreUnescaped();
  TestSpacesInsideStringFieldDoNotSplit();
  TestQuotesAreLiteralInTagSection();
  TestFloatsIgnoreLocale();
  TestTrimsCarriageReturnAndWhitespace();
  TestRejectsMalformedLines();
  TestTimestampRejectionExplainsWhy();

  std::cout << "serial_collector_unit_line_parser: pass\n";
  return 0;
}
