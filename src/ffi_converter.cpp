#include "ffistub/ffi_converter.hpp"
#include "ffistub/assertions.hpp"
#include "ffistub/diagnostics.hpp"
#include "ffistub/env.hpp"
#include <algorithm>

namespace ffistub {

struct FfiConverter::State {
    Phase phase = Phase::Collect;
    Edition edition = Edition::Rust2021;
    std::vector<Item> source_items;
    std::vector<Item> followup_items;
    ExportedTypeIndex exported;
    PrimitiveTable primitives = default_primitives();
    TransmutePairs pairs;
    RewriteConfig rewrite;
};

static Path configured_path(const std::string& text, const char* what){
    auto p = parse_path(text);
    if(!p) throw conversion_error(ErrorKind::Configuration, "FS0102", std::string("invalid ") + what + " path '" + text + "'");
    return *p;
}

FfiConverter::Builder::Builder(std::string source_crate_name) : crate_name_(std::move(source_crate_name)) {
    allowed_prefixes_ = default_allowed_prefixes();
}

FfiConverter::Builder& FfiConverter::Builder::edition(Edition e){ edition_ = e; return *this; }

FfiConverter::Builder& FfiConverter::Builder::allowed_prefix(const std::string& path){
    allowed_prefixes_.push_back(configured_path(path, "allowed prefix"));
    return *this;
}

FfiConverter::Builder& FfiConverter::Builder::strip_transparent_wrapper(const std::string& path){
    transparent_wrappers_.push_back(configured_path(path, "transparent wrapper"));
    return *this;
}

FfiConverter::Builder& FfiConverter::Builder::prefixed_exported_type(const std::string& path){
    prefixed_exported_types_.push_back(configured_path(path, "prefixed exported type"));
    return *this;
}

FfiConverter FfiConverter::Builder::build() const { return FfiConverter(*this); }

FfiConverter::FfiConverter(const Builder& b) : st_(std::make_unique<State>()) {
    std::string crate = b.crate_name_;
    std::replace(crate.begin(), crate.end(), '-', '_');
    if(!parse_path(crate))
        throw conversion_error(ErrorKind::Configuration, "FS0102", "invalid source crate name '" + b.crate_name_ + "'");
    st_->edition = b.edition_;
    st_->rewrite.crate_name = crate;
    st_->rewrite.exported = &st_->exported;
    st_->rewrite.primitives = &st_->primitives;
    st_->rewrite.allowed_prefixes = b.allowed_prefixes_;
    st_->rewrite.transparent_wrappers = b.transparent_wrappers_;
    st_->rewrite.prefixed_exported_types = b.prefixed_exported_types_;
}

FfiConverter::~FfiConverter() = default;
FfiConverter::FfiConverter(FfiConverter&&) noexcept = default;
FfiConverter& FfiConverter::operator=(FfiConverter&&) noexcept = default;

FfiConverter::Phase FfiConverter::phase() const { return st_->phase; }
const ExportedTypeIndex& FfiConverter::exported_types() const { return st_->exported; }
const PrimitiveTable& FfiConverter::primitive_types() const { return st_->primitives; }
const TransmutePairs& FfiConverter::pairs() const { return st_->pairs; }
const std::string& FfiConverter::crate_name() const { return st_->rewrite.crate_name; }

void FfiConverter::collect(ItemSource& upstream){
    while(auto it = upstream()){
        const auto& d = it->decl;
        if(d.is_type()){
            st_->exported.insert(ExportedTypeIndex::key_for(d));
            if(auto* alias = std::get_if<AliasBody>(&d.body)){
                auto* p = alias->target ? std::get_if<PathType>(&alias->target->data) : nullptr;
                if(p && !p->path.empty()){
                    auto prim = st_->primitives.find(p->path.last_ident());
                    if(prim!=st_->primitives.end()){
                        std::string resolved = prim->second;
                        st_->primitives[d.name] = resolved;
                        st_->primitives[st_->rewrite.crate_name + "::" + d.name] = resolved;
                    }
                }
            }
        }
        st_->source_items.push_back(std::move(*it));
    }
    trace("collect", std::to_string(st_->source_items.size()) + " items, " + std::to_string(st_->exported.size()) + " exported type keys");
}

Item FfiConverter::convert_item(const Item& item){
    TypeRewriter rewriter(st_->rewrite);
    if(item.decl.is<FunctionBody>())
        return Item{convert_to_stub(item.decl, rewriter, st_->edition, st_->pairs, item.location), item.location};
    return Item{rewrite_declaration_types(item.decl, rewriter, st_->pairs, item.location), item.location};
}

std::optional<Item> FfiConverter::call(ItemSource& upstream){
    if(st_->phase==Phase::Collect){
        collect(upstream);
        st_->phase = Phase::Convert;
    }
    if(st_->phase==Phase::Convert){
        if(!st_->source_items.empty()){
            Item it = std::move(st_->source_items.back());
            st_->source_items.pop_back();
            return convert_item(it);
        }
        st_->followup_items = generate_assertions(st_->pairs);
        trace("followup", std::to_string(st_->pairs.size()) + " pairs, " + std::to_string(st_->followup_items.size()) + " assertions");
        st_->phase = Phase::Followup;
    }
    if(st_->followup_items.empty()) return std::nullopt;
    Item it = std::move(st_->followup_items.back());
    st_->followup_items.pop_back();
    return it;
}

std::vector<Item> FfiConverter::convert_all(std::vector<Item> items){
    auto src = from_items(std::move(items));
    std::vector<Item> out;
    while(auto it = call(src)) out.push_back(std::move(*it));
    return out;
}

} // namespace ffistub
