#include "rustdecl/source.hpp"
#include "parser/parser.hpp"
#include "ffistub/diagnostics.hpp"
#include "ffistub/env.hpp"

namespace rustdecl {

ffistub::Item Source::load(const ffistub::Record& r) const {
    Parser p;
    auto res = p.parse_string(r.content, r.location.file);
    if(!res.success){
        int line = r.location.line > 0 ? r.location.line + res.line - 1 : res.line;
        int col = (res.line == 1 && r.location.column > 0) ? r.location.column + res.column - 1 : res.column;
        throw ffistub::conversion_error(ffistub::ErrorKind::Parse, "FS0301",
                                        "cannot parse record '" + r.name + "': " + res.error_message,
                                        ffistub::SourceLocation{r.location.file, line, col});
    }
    const char* kw = ffistub::record_kind_keyword(r.kind);
    if(res.items.size() != 1)
        throw ffistub::conversion_error(ffistub::ErrorKind::Parse, "FS0302",
                                        "record '" + r.name + "' (:" + kw + ") must contain exactly one declaration, found " + std::to_string(res.items.size()),
                                        r.location);
    auto& item = res.items.front();
    auto kind = ffistub::record_kind_of(item.decl.kind());
    if(!kind || *kind != r.kind || item.decl.name != r.name)
        throw ffistub::conversion_error(ffistub::ErrorKind::Parse, "FS0302",
                                        "record '" + r.name + "' (:" + kw + ") does not match its content",
                                        r.location, "content declares " + std::string(ffistub::kind_name(item.decl.kind())) + " '" + item.decl.name + "'");
    if(r.location.known()) item.location = r.location;
    return std::move(item);
}

Source& Source::add_records(const std::vector<ffistub::Record>& records){
    size_t before = items_.size();
    for(auto& r: records){
        if(!seen_.insert(ffistub::to_edn(r)).second) continue;
        items_.push_back(load(r));
    }
    ffistub::trace("source", crate_ + ": loaded " + std::to_string(items_.size() - before) + " of " + std::to_string(records.size()) + " records");
    return *this;
}

Source& Source::add_file(const std::string& path){
    return add_records(ffistub::read_record_file(path));
}

} // namespace rustdecl
