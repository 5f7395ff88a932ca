#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "ffistub/cfg_filter.hpp"
#include "ffistub/diagnostics.hpp"
#include "ffistub/env.hpp"
#include "ffistub/ffi_converter.hpp"
#include "ffistub/map.hpp"
#include "ffistub/print.hpp"
#include "rustdecl/source.hpp"

using namespace ffistub;

static const char* kUsage =
    "usage: ffistub --crate NAME [options] <records.edn>...\n"
    "  --enable-feature F          --disable-feature F\n"
    "  --map-feature FROM=TO       --disable-unknown-features\n"
    "  --predefined-features CONST LIST\n"
    "  --target TRIPLE             --target-arch/--target-vendor/--target-os/--target-env V\n"
    "  --allowed-prefix P          --transparent-wrapper P\n"
    "  --prefixed-exported-type P  --edition 2021|2024\n"
    "  --strip-derive D            --strip-macro M\n"
    "  --replace-type FROM=TO      --cfg-only  --locations  -o FILE\n";

static int usage(const std::string& msg){
    if(!msg.empty()) std::cerr << "ffistub: " << msg << "\n";
    std::cerr << kUsage;
    return 2;
}

static bool split_pair(const std::string& s, std::string& a, std::string& b){
    auto eq = s.find('=');
    if(eq==std::string::npos || eq==0 || eq+1==s.size()) return false;
    a = s.substr(0, eq); b = s.substr(eq+1);
    return true;
}

int main(int argc, char** argv){
    RunEnv env = detect_env();
    std::string crate, out_path, target = env.target_triple, edition_text = env.edition;
    std::vector<std::string> inputs;
    auto filter_builder = CfgFilter::builder();
    std::vector<std::string> allowed, wrappers, prefixed;
    StripDerives derives; StripMacros macros; ReplaceTypes replacements;
    std::optional<std::string> arch, vendor, os, target_env;
    bool any_derive = false, any_macro = false, any_replace = false, cfg_only = false, with_locations = false;

    try {
        for(int i=1;i<argc;++i){
            std::string a = argv[i];
            auto value = [&](const char* opt) -> std::string {
                if(i+1>=argc) throw std::invalid_argument(std::string("missing value for ") + opt);
                return argv[++i];
            };
            if(a=="--crate") crate = value("--crate");
            else if(a=="--enable-feature") filter_builder.enable_feature(value("--enable-feature"));
            else if(a=="--disable-feature") filter_builder.disable_feature(value("--disable-feature"));
            else if(a=="--map-feature"){
                std::string from, to;
                if(!split_pair(value("--map-feature"), from, to)) return usage("--map-feature expects FROM=TO");
                filter_builder.match_feature(from, to);
            }
            else if(a=="--disable-unknown-features") filter_builder.disable_unknown_features();
            else if(a=="--predefined-features"){
                std::string constant = value("--predefined-features");
                filter_builder.predefined_features(constant, value("--predefined-features"));
            }
            else if(a=="--target") target = value("--target");
            else if(a=="--target-arch") arch = value("--target-arch");
            else if(a=="--target-vendor") vendor = value("--target-vendor");
            else if(a=="--target-os") os = value("--target-os");
            else if(a=="--target-env") target_env = value("--target-env");
            else if(a=="--allowed-prefix") allowed.push_back(value("--allowed-prefix"));
            else if(a=="--transparent-wrapper") wrappers.push_back(value("--transparent-wrapper"));
            else if(a=="--prefixed-exported-type") prefixed.push_back(value("--prefixed-exported-type"));
            else if(a=="--edition") edition_text = value("--edition");
            else if(a=="--strip-derive"){ derives.strip(value("--strip-derive")); any_derive = true; }
            else if(a=="--strip-macro"){ macros.strip(value("--strip-macro")); any_macro = true; }
            else if(a=="--replace-type"){
                std::string from, to;
                if(!split_pair(value("--replace-type"), from, to)) return usage("--replace-type expects FROM=TO");
                replacements.replace(from, to); any_replace = true;
            }
            else if(a=="--cfg-only") cfg_only = true;
            else if(a=="--locations") with_locations = true;
            else if(a=="-o") out_path = value("-o");
            else if(a=="-h" || a=="--help"){ std::cout << kUsage; return 0; }
            else if(!a.empty() && a[0]=='-') return usage("unknown option " + a);
            else inputs.push_back(a);
        }
    } catch(const std::invalid_argument& e){
        return usage(e.what());
    } catch(const conversion_error& e){
        report(e);
        return 1;
    }
    if(crate.empty()) return usage("--crate is required");
    if(inputs.empty()) return usage("no record files given");
    auto edition = edition_text.empty() ? std::optional<Edition>(Edition::Rust2021) : parse_edition(edition_text);
    if(!edition) return usage("unsupported edition '" + edition_text + "'");

    try {
        // explicit axes win over the triple, whatever the argument order
        if(!target.empty()) filter_builder.target_triple(target);
        if(arch) filter_builder.enable_target_arch(*arch);
        if(vendor) filter_builder.enable_target_vendor(*vendor);
        if(os) filter_builder.enable_target_os(*os);
        if(target_env) filter_builder.enable_target_env(*target_env);
        auto conv_builder = FfiConverter::builder(crate);
        conv_builder.edition(*edition);
        for(auto& p: allowed) conv_builder.allowed_prefix(p);
        for(auto& p: wrappers) conv_builder.strip_transparent_wrapper(p);
        for(auto& p: prefixed) conv_builder.prefixed_exported_type(p);

        rustdecl::Source source(crate);
        for(auto& f: inputs) source.add_file(f);

        CfgFilter filter = filter_builder.build();
        FfiConverter converter = conv_builder.build();

        ItemSource stream = chain(source.stream(), filter);
        if(any_macro) stream = map_items(std::move(stream), macros);
        if(any_derive) stream = map_items(std::move(stream), derives);
        if(any_replace) stream = map_items(std::move(stream), replacements);
        if(!cfg_only) stream = chain(std::move(stream), converter);
        auto items = drain(stream);

        if(out_path.empty()){
            write_items(std::cout, items, with_locations);
        } else {
            std::ofstream ofs(out_path);
            if(!ofs) throw conversion_error(ErrorKind::Io, "FS0401", "cannot write output file '" + out_path + "'");
            write_items(ofs, items, with_locations);
        }
        trace("driver", std::to_string(items.size()) + " items written");
    } catch(const conversion_error& e){
        report(e);
        return 1;
    }
    return 0;
}
