#include <fstream>
#include <iostream>
#include <sstream>
#include "ffistub/diagnostics.hpp"
#include "ffistub/record.hpp"
#include "parser/parser.hpp"

using namespace ffistub;

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: ffistub_collect <file.rs> [-o records.edn]\n"; return 2; }
    std::string file = argv[1], out_path;
    for(int i=2;i<argc;++i){
        std::string a = argv[i];
        if(a=="-o" && i+1<argc) out_path = argv[++i];
        else { std::cerr << "ffistub_collect: unexpected argument " << a << "\n"; return 2; }
    }
    try {
        std::ifstream ifs(file, std::ios::binary);
        if(!ifs) throw conversion_error(ErrorKind::Io, "FS0401", "cannot open source file '" + file + "'");
        std::stringstream ss; ss << ifs.rdbuf();
        auto res = rustdecl::Parser().parse_string(ss.str(), file);
        if(!res.success)
            throw conversion_error(ErrorKind::Parse, "FS0301", "cannot parse declarations: " + res.error_message,
                                   SourceLocation{file, res.line, res.column});
        std::vector<Record> records;
        for(size_t i=0;i<res.items.size();++i){
            auto& it = res.items[i];
            records.push_back(Record{*record_kind_of(it.decl.kind()), it.decl.name, res.sources[i], it.location});
        }
        if(out_path.empty()){
            write_records(std::cout, records);
        } else {
            std::ofstream ofs(out_path);
            if(!ofs) throw conversion_error(ErrorKind::Io, "FS0401", "cannot write record file '" + out_path + "'");
            write_records(ofs, records);
        }
    } catch(const conversion_error& e){
        report(e);
        return 1;
    }
    return 0;
}
