#include "internal/codec/metadata_codec.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "internal/codec/date_tags.hpp"
#include "internal/codec/json_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using pmm::codec::DumpMetadata;
using pmm::codec::LoadsMetadata;
using pmm::model::Field;
using pmm::model::FieldType;
using pmm::model::Metadata;
using pmm::model::Value;
using pmm::model::ValueList;
using pmm::model::ValueMap;

struct FieldSpec {
  std::string name;
  std::string type;
  std::string role;
  std::string tag;
};

// Canonical sidecar text for the hillstrom email campaign dataset.
std::string HillstromSidecar() {
  const std::vector<FieldSpec> fields = {
      {"recency", "integer", "", ""},
      {"history_segment", "string", "", "categorical"},
      {"history", "real", "", ""},
      {"mens", "boolean", "", ""},
      {"womens", "boolean", "", ""},
      {"zip_code", "string", "", "categorical"},
      {"newbie", "boolean", "", ""},
      {"channel", "string", "", "categorical"},
      {"segment", "string", "treatment", "categorical"},
      {"visit", "boolean", "dependent", ""},
      {"conversion", "boolean", "", ""},
      {"spend", "real", "", ""},
  };

  std::ostringstream out;
  out << "{\n"
      << "    \"pmmversion\": \"0.1\",\n"
      << "    \"name\": \"hillstrom\",\n"
      << "    \"recordcount\": 64000,\n"
      << "    \"fieldcount\": 12,\n"
      << "    \"fields\": [\n";
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto& f = fields[i];
    out << "        {\n"
        << "            \"name\": \"" << f.name << "\",\n"
        << "            \"type\": \"" << f.type << "\",\n"
        << "            \"role\": \"" << f.role << "\",\n";
    if (f.tag.empty()) {
      out << "            \"tags\": {},\n";
    } else {
      out << "            \"tags\": {\n"
          << "                \"" << f.tag << "\": null\n"
          << "            },\n";
    }
    out << "            \"stats\": {}\n"
        << "        }" << (i + 1 < fields.size() ? "," : "") << "\n";
  }
  out << "    ],\n"
      << "    \"tags\": {},\n"
      << "    \"data\": {\n"
      << "        \"flatfile\": {\n"
      << "            \"name\": \"hillstrom.csv\",\n"
      << "            \"format\": {\n"
      << "                \"encoding\": \"UTF-8\",\n"
      << "                \"separator\": \",\",\n"
      << "                \"quote\": \"\\\"\",\n"
      << "                \"escape\": \"\\\\\",\n"
      << "                \"nullmarker\": \"\",\n"
      << "                \"headerrowcount\": 1\n"
      << "            }\n"
      << "        }\n"
      << "    }\n"
      << "}";
  return out.str();
}

Metadata BuildVictorLo() {
  auto trade = Field::Create("trade", FieldType::kInteger, pmm::model::role::kIndependent);
  trade.tags.Set(std::string(pmm::model::tag::kCategorical), Value());

  auto metadata = Metadata::Create("victorlo", 99999,
                                   {
                                       Field::Create("age", FieldType::kReal, pmm::model::role::kIndependent),
                                       trade,
                                       Field::Create("wealth", FieldType::kReal, pmm::model::role::kIndependent),
                                       Field::Create("trt_flg", FieldType::kInteger, pmm::model::role::kTreatment),
                                       Field::Create("respond", FieldType::kInteger, pmm::model::role::kDependent),
                                       Field::Create("trn_flg", FieldType::kInteger, pmm::model::role::kValidation),
                                   });

  pmm::model::Data data;
  data.flatfile.name = "VictorLoDRA.dat";
  metadata.data        = data;
  metadata.description = "Synthetic dataset for True Lift paper";
  metadata.creator     = "Victor Lo";
  metadata.permissions = "Public";
  return metadata;
}

void TestHillstromLoadsAndResavesByteIdentical() {
  const auto text     = HillstromSidecar();
  auto       metadata = LoadsMetadata(text);

  assert(metadata.name == "hillstrom");
  assert(metadata.recordcount == 64000);
  assert(metadata.fieldcount == 12);
  assert(metadata.fields.size() == 12);
  assert(metadata.fields[0].name == "recency");
  assert(metadata.fields[0].type == "integer");
  assert(metadata.fields[3].type == "boolean");
  assert(metadata.fields[11].type == "real");
  assert(metadata.data.has_value());
  assert(metadata.data->flatfile.name == "hillstrom.csv");
  assert(metadata.data->flatfile.format.headerrowcount == 1);
  assert(metadata.data->flatfile.format.escape == "\\");
  assert(!metadata.datetagformat.has_value());
  metadata.Validate();

  assert(DumpMetadata(metadata) == text);
}

void TestConstructedMetadataRoundTrips() {
  auto       metadata = BuildVictorLo();
  const auto text     = DumpMetadata(metadata);
  auto       loaded   = LoadsMetadata(text);

  assert(loaded == metadata);
  assert(DumpMetadata(loaded) == text);
  assert(text.find("\"description\": \"Synthetic dataset for True Lift paper\"") != std::string::npos);
  assert(text.back() == '}');
  assert(text.find(" \n") == std::string::npos);
}

void TestTagsAreEmittedSorted() {
  auto metadata = BuildVictorLo();
  metadata.SetTag("zulu", Value(1));
  metadata.SetTag("alpha", Value(2));

  const auto text = DumpMetadata(metadata);
  assert(text.find("\"alpha\"") < text.find("\"zulu\""));
  // The live object keeps insertion order.
  assert(metadata.tags.begin()->first == "zulu");
}

void TestNonAsciiIsEscaped() {
  auto metadata = BuildVictorLo();
  metadata.SetTag("city", Value("caf\xC3\xA9"));

  const auto text = DumpMetadata(metadata);
  assert(text.find("\"caf\\u00e9\"") != std::string::npos);
  assert(LoadsMetadata(text).tags.Find("city")->AsString() == "caf\xC3\xA9");
}

void TestDateTagsAreTranscoded() {
  auto       metadata = BuildVictorLo();
  const auto created  = pmm::util::MakeTimePoint(2016, 3, 1, 12, 30, 5);
  metadata.SetTag("created", Value(created));
  metadata.SetFieldTag("age", "checked", Value(ValueList{Value(created), Value("not a date")}));
  metadata.SetTag("label", Value("2016"));

  const auto text = DumpMetadata(metadata);
  assert(text.find("\"created\": \"2016-03-01 12:30:05\"") != std::string::npos);
  assert(text.find("\"datetagformat\": \"%Y-%m-%d %H:%M:%S\"") != std::string::npos);

  // The live object keeps its timestamps and records the format.
  assert(metadata.tags.Find("created")->IsTimestamp());
  assert(metadata.datetagformat == std::string("%Y-%m-%d %H:%M:%S"));

  auto loaded = LoadsMetadata(text);
  assert(loaded.tags.Find("created")->AsTimestamp() == created);
  assert(loaded.tags.Find("label")->AsString() == "2016");
  const auto& checked = loaded.GetField("age").tags.Find("checked")->AsList();
  assert(checked[0].AsTimestamp() == created);
  assert(checked[1].AsString() == "not a date");

  assert(DumpMetadata(loaded) == text);
}

void TestCustomDateTagFormat() {
  auto metadata          = BuildVictorLo();
  metadata.datetagformat = "%d/%m/%Y";
  metadata.SetTag("released", Value(pmm::util::MakeTimePoint(2017, 12, 24)));

  const auto text = DumpMetadata(metadata);
  assert(text.find("\"released\": \"24/12/2017\"") != std::string::npos);
  assert(LoadsMetadata(text).tags.Find("released")->AsTimestamp() == pmm::util::MakeTimePoint(2017, 12, 24));
}

void TestDateLikeStringsStayStringsWithoutFormat() {
  auto metadata = BuildVictorLo();
  metadata.SetTag("when", Value("2016-03-01 12:30:05"));

  const auto text = DumpMetadata(metadata);
  assert(text.find("datetagformat") == std::string::npos);
  assert(LoadsMetadata(text).tags.Find("when")->IsString());
}

void TestOutOfRangeDatesStayStrings() {
  auto metadata          = BuildVictorLo();
  metadata.datetagformat = "%Y-%m-%d %H:%M:%S";
  metadata.SetTag("created", Value(pmm::util::MakeTimePoint(2016, 2, 29)));
  metadata.SetTag("when", Value("2016-02-31 00:00:00"));
  metadata.SetTag("late", Value("2016-03-01 25:00:00"));

  const auto text   = DumpMetadata(metadata);
  auto       loaded = LoadsMetadata(text);
  assert(loaded.tags.Find("created")->AsTimestamp() == pmm::util::MakeTimePoint(2016, 2, 29));
  assert(loaded.tags.Find("when")->IsString());
  assert(loaded.tags.Find("when")->AsString() == "2016-02-31 00:00:00");
  assert(loaded.tags.Find("late")->IsString());
  assert(DumpMetadata(loaded) == text);

  assert(!pmm::util::ParseTimePoint("2016-02-31", "%Y-%m-%d"));
  assert(!pmm::util::ParseTimePoint("2015-02-29", "%Y-%m-%d"));
  assert(pmm::util::ParseTimePoint("2017-12", "%Y-%m") == pmm::util::MakeTimePoint(2017, 12, 1));
}

void TestNonFiniteRealsSurviveReload() {
  auto metadata = BuildVictorLo();
  metadata.GetField("age").stats.mean = std::numeric_limits<double>::quiet_NaN();
  metadata.GetField("wealth").stats.min  = Value(-std::numeric_limits<double>::infinity());
  metadata.GetField("wealth").stats.max  = Value(std::numeric_limits<double>::infinity());
  metadata.SetTag("ratio", Value(std::numeric_limits<double>::quiet_NaN()));
  metadata.SetTag("word", Value("NaN"));

  const auto text = DumpMetadata(metadata);
  assert(text.find("\"mean\": NaN") != std::string::npos);
  assert(text.find("\"min\": -Infinity") != std::string::npos);
  assert(text.find("\"max\": Infinity") != std::string::npos);
  assert(text.find("\"ratio\": NaN") != std::string::npos);
  assert(text.find("\"word\": \"NaN\"") != std::string::npos);
  assert(text.find("\\u0001") == std::string::npos);

  auto loaded = LoadsMetadata(text);
  assert(std::isnan(*loaded.GetField("age").stats.mean));
  assert(std::isinf(loaded.GetField("wealth").stats.min->AsReal()));
  assert(loaded.GetField("wealth").stats.min->AsReal() < 0);
  assert(loaded.GetField("wealth").stats.max->AsReal() > 0);
  assert(std::isnan(loaded.tags.Find("ratio")->AsReal()));
  assert(loaded.tags.Find("word")->AsString() == "NaN");
  assert(DumpMetadata(loaded) == text);
}

void TestMalformedDocuments() {
  bool thrown = false;
  try {
    LoadsMetadata("{\"pmmversion\": ");
  } catch (const pmm::util::PmmError&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    LoadsMetadata("[1, 2]");
  } catch (const pmm::util::TypeMismatch&) {
    thrown = true;
  }
  assert(thrown);
}

void TestSaveAndLoadFile() {
  const auto dir = std::filesystem::temp_directory_path() / "pmm_metadata_codec_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / "victorlo.pmm").string();

  auto metadata = BuildVictorLo();
  pmm::codec::SaveMetadata(metadata, path);

  std::ifstream      in(path, std::ios::binary);
  std::ostringstream contents;
  contents << in.rdbuf();
  assert(contents.str() == DumpMetadata(metadata));

  assert(pmm::codec::LoadMetadata(path) == metadata);
  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestHillstromLoadsAndResavesByteIdentical();
  TestConstructedMetadataRoundTrips();
  TestTagsAreEmittedSorted();
  TestNonAsciiIsEscaped();
  TestDateTagsAreTranscoded();
  TestCustomDateTagFormat();
  TestDateLikeStringsStayStringsWithoutFormat();
  TestOutOfRangeDatesStayStrings();
  TestNonFiniteRealsSurviveReload();
  TestMalformedDocuments();
  TestSaveAndLoadFile();

  std::cout << "metadata_codec_test: PASS\n";
  return 0;
}
