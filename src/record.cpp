#include "ffistub/record.hpp"
#include "ffistub/diagnostics.hpp"
#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace ffistub {

namespace {

// Reads record maps straight into Records. Values are strings, keywords or
// integers; the file may hold bare maps or one vector of them. Commas are
// whitespace and `;` comments run to the end of the line.
class RecordScanner {
public:
    RecordScanner(std::string_view text, const std::string& origin) : text_(text), origin_(origin) {}

    std::vector<Record> read_all(){
        std::vector<Record> out;
        skip_blank();
        while(!at_end()){
            if(peek()=='['){
                int l = line_, c = col_;
                advance();
                skip_blank();
                while(!at_end() && peek()!=']'){ out.push_back(read_record()); skip_blank(); }
                if(at_end()) fail("unterminated vector", l, c);
                advance();
            } else {
                out.push_back(read_record());
            }
            skip_blank();
        }
        return out;
    }

private:
    struct Scalar {
        enum class Kind { String, Keyword, Integer } kind = Kind::String;
        std::string text;
        int64_t number = 0;
        int line = 0, col = 0;
    };

    bool at_end() const { return pos_>=text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    char advance(){
        char c = text_[pos_++];
        if(c=='\n'){ ++line_; col_ = 1; }
        else ++col_;
        return c;
    }

    void skip_blank(){
        while(!at_end()){
            char c = peek();
            if(c==';'){ while(!at_end() && advance()!='\n'){} }
            else if(c==',' || std::isspace((unsigned char)c)) advance();
            else break;
        }
    }

    [[noreturn]] void fail(const std::string& msg, int line, int col) const {
        throw conversion_error(ErrorKind::Parse, "FS0302", "malformed record file: " + msg, SourceLocation{origin_, line, col});
    }

    static bool word_char(char c){ return std::isalnum((unsigned char)c) || c=='_' || c=='-'; }

    Scalar read_scalar(){
        Scalar s;
        s.line = line_; s.col = col_;
        char c = peek();
        if(c=='"'){
            advance();
            for(;;){
                if(at_end()) fail("unterminated string", s.line, s.col);
                char ch = advance();
                if(ch=='"') break;
                if(ch!='\\'){ s.text.push_back(ch); continue; }
                if(at_end()) fail("unterminated string", s.line, s.col);
                switch(advance()){
                    case 'n': s.text.push_back('\n'); break;
                    case 't': s.text.push_back('\t'); break;
                    case 'r': s.text.push_back('\r'); break;
                    case '"': s.text.push_back('"'); break;
                    case '\\': s.text.push_back('\\'); break;
                    default: fail("bad escape in string", line_, col_-1);
                }
            }
            return s;
        }
        if(c==':'){
            advance();
            while(!at_end() && word_char(peek())) s.text.push_back(advance());
            if(s.text.empty()) fail("empty keyword", s.line, s.col);
            s.kind = Scalar::Kind::Keyword;
            return s;
        }
        if(std::isdigit((unsigned char)c) || c=='-'){
            s.text.push_back(advance());
            while(!at_end() && std::isdigit((unsigned char)peek())) s.text.push_back(advance());
            try { s.number = std::stoll(s.text); }
            catch(const std::logic_error&){ fail("invalid integer '" + s.text + "'", s.line, s.col); }
            s.kind = Scalar::Kind::Integer;
            return s;
        }
        fail(at_end() ? std::string("unexpected end of input") : "unexpected '" + std::string(1, c) + "'", s.line, s.col);
    }

    Record read_record(){
        int l = line_, c = col_;
        if(peek()!='{') fail("record must be a map", l, c);
        advance();
        std::map<std::string, Scalar> fields;
        for(skip_blank(); peek()!='}'; skip_blank()){
            if(at_end()) fail("unterminated record", l, c);
            auto key = read_scalar();
            if(key.kind!=Scalar::Kind::Keyword) fail("record keys must be keywords", key.line, key.col);
            skip_blank();
            if(at_end() || peek()=='}') fail("missing value for :" + key.text, key.line, key.col);
            fields[key.text] = read_scalar();
        }
        advance();

        auto find = [&](const char* key) -> const Scalar* {
            auto it = fields.find(key);
            return it==fields.end() ? nullptr : &it->second;
        };
        auto expect = [&](const char* key, Scalar::Kind kind, const char* what) -> const Scalar* {
            auto* v = find(key);
            if(v && v->kind!=kind) fail(std::string(":") + key + " must be " + what, v->line, v->col);
            return v;
        };
        auto require = [&](const char* key, Scalar::Kind kind, const char* what) -> const Scalar& {
            auto* v = expect(key, kind, what);
            if(!v) fail(std::string("record is missing :") + key, l, c);
            return *v;
        };

        Record out;
        auto& kind = require("kind", Scalar::Kind::Keyword, "a keyword");
        auto rk = record_kind_from_keyword(kind.text);
        if(!rk) fail("unknown record kind :" + kind.text, kind.line, kind.col);
        out.kind = *rk;
        out.name = require("name", Scalar::Kind::String, "a string").text;
        out.content = require("content", Scalar::Kind::String, "a string").text;
        if(auto* f = expect("file", Scalar::Kind::String, "a string")) out.location.file = f->text;
        if(auto* n = expect("line", Scalar::Kind::Integer, "an integer")) out.location.line = static_cast<int>(n->number);
        if(auto* n = expect("column", Scalar::Kind::Integer, "an integer")) out.location.column = static_cast<int>(n->number);
        return out;
    }

    std::string_view text_;
    const std::string& origin_;
    size_t pos_ = 0;
    int line_ = 1, col_ = 1;
};

std::string quote(const std::string& s){
    std::string out = "\"";
    for(char c: s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out.push_back(c);
        }
    }
    return out + "\"";
}

} // namespace

const char* record_kind_keyword(RecordKind k){
    switch(k){
        case RecordKind::Struct: return "struct";
        case RecordKind::Enum: return "enum";
        case RecordKind::Union: return "union";
        case RecordKind::TypeAlias: return "type";
        case RecordKind::Const: return "const";
        case RecordKind::Static: return "static";
        case RecordKind::Function: return "fn";
    }
    return "struct";
}

std::optional<RecordKind> record_kind_from_keyword(std::string_view kw){
    static const std::map<std::string_view, RecordKind> table = {
        {"struct", RecordKind::Struct}, {"enum", RecordKind::Enum}, {"union", RecordKind::Union},
        {"type", RecordKind::TypeAlias}, {"const", RecordKind::Const}, {"static", RecordKind::Static},
        {"fn", RecordKind::Function},
    };
    auto it = table.find(kw);
    if(it==table.end()) return std::nullopt;
    return it->second;
}

std::optional<RecordKind> record_kind_of(DeclKind k){
    switch(k){
        case DeclKind::Struct: return RecordKind::Struct;
        case DeclKind::Enum: return RecordKind::Enum;
        case DeclKind::Union: return RecordKind::Union;
        case DeclKind::TypeAlias: return RecordKind::TypeAlias;
        case DeclKind::Const: return RecordKind::Const;
        case DeclKind::Static: return RecordKind::Static;
        case DeclKind::Function: return RecordKind::Function;
        case DeclKind::Assertion: return std::nullopt;
    }
    return std::nullopt;
}

std::vector<Record> read_records(std::string_view text, const std::string& origin){
    return RecordScanner(text, origin).read_all();
}

std::vector<Record> read_record_file(const std::string& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw conversion_error(ErrorKind::Io, "FS0401", "cannot open record file '" + path + "'");
    std::stringstream ss;
    ss << in.rdbuf();
    return read_records(ss.str(), path);
}

std::string to_edn(const Record& r){
    std::string out = "{:kind :";
    out += record_kind_keyword(r.kind);
    out += " :name " + quote(r.name);
    out += " :content " + quote(r.content);
    if(!r.location.file.empty()) out += " :file " + quote(r.location.file);
    if(r.location.line > 0) out += " :line " + std::to_string(r.location.line);
    if(r.location.column > 0) out += " :column " + std::to_string(r.location.column);
    return out + "}";
}

void write_records(std::ostream& os, const std::vector<Record>& records){
    for(auto& r: records) os << to_edn(r) << "\n";
}

} // namespace ffistub
