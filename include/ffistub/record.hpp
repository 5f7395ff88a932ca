// Declaration records: one EDN map per source item.
//   {:kind :struct :name "Foo" :content "pub struct Foo {..}" :file "src/lib.rs" :line 3 :column 1}
#pragma once
#include "ffistub/ast.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ffistub {

enum class RecordKind { Struct, Enum, Union, TypeAlias, Const, Static, Function };

// Keyword spelling without the colon ("struct", "type", "fn", ...).
const char* record_kind_keyword(RecordKind k);
std::optional<RecordKind> record_kind_from_keyword(std::string_view kw);
std::optional<RecordKind> record_kind_of(DeclKind k);

struct Record {
    RecordKind kind{RecordKind::Struct};
    std::string name;
    std::string content;
    SourceLocation location;

    bool operator==(const Record& o) const {
        return kind==o.kind && name==o.name && content==o.content && location.file==o.location.file &&
               location.line==o.location.line && location.column==o.location.column;
    }
    bool operator!=(const Record& o) const { return !(*this==o); }
};

// Parse all records of a file. Throws conversion_error FS0302 (with the
// position inside `origin`) on malformed input or missing keys.
std::vector<Record> read_records(std::string_view text, const std::string& origin = "<memory>");

// Read a record file from disk (FS0401 when it cannot be opened).
std::vector<Record> read_record_file(const std::string& path);

std::string to_edn(const Record& r);
void write_records(std::ostream& os, const std::vector<Record>& records);

} // namespace ffistub
