#include "provenance.hpp"

namespace pmm::model {

const RecordSchema<FlatFileFormat>& FlatFileFormat::Schema() {
  static const RecordSchema<FlatFileFormat> schema(
      "FlatFileFormat", {
                            Defaulted("encoding", &FlatFileFormat::encoding, Value("UTF-8")),
                            Defaulted("separator", &FlatFileFormat::separator, Value(",")),
                            Defaulted("quote", &FlatFileFormat::quote, Value("\"")),
                            Defaulted("escape", &FlatFileFormat::escape, Value("\\")),
                            Defaulted("nullmarker", &FlatFileFormat::nullmarker, Value("")),
                            Defaulted("headerrowcount", &FlatFileFormat::headerrowcount, Value(1)),
                            Defaulted("dateformat", &FlatFileFormat::dateformat, Value()),
                        });
  return schema;
}

const RecordSchema<FlatFile>& FlatFile::Schema() {
  static const RecordSchema<FlatFile> schema("FlatFile", {
                                                             Required("name", &FlatFile::name),
                                                             Required("format", &FlatFile::format),
                                                         });
  return schema;
}

const RecordSchema<Data>& Data::Schema() {
  // Only the flat-file representation exists so far.
  static const RecordSchema<Data> schema("Data", {Required("flatfile", &Data::flatfile)});
  return schema;
}

} // namespace pmm::model
