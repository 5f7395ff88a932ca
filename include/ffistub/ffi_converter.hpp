// Three-phase conversion of a declaration stream:
//   Collect   drain the input, index exported type names and primitive aliases
//   Convert   emit one converted declaration per call (functions become stubs)
//   Followup  emit the size/alignment assertions of the recorded pairs
// Items come out in reverse collection order.
#pragma once
#include "ffistub/ast.hpp"
#include "ffistub/stub.hpp"
#include "ffistub/type_rewriter.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ffistub {

class FfiConverter {
public:
    enum class Phase { Collect, Convert, Followup };

    class Builder {
    public:
        explicit Builder(std::string source_crate_name);

        Builder& edition(Edition e);
        // Additional path prefix accepted as FFI safe (e.g. "my_sys").
        Builder& allowed_prefix(const std::string& path);
        // Zero-cost wrapper whose first type argument is used instead (e.g. "std::mem::MaybeUninit").
        Builder& strip_transparent_wrapper(const std::string& path);
        // Fully qualified path of a re-exported type written as its last segment locally.
        Builder& prefixed_exported_type(const std::string& path);

        FfiConverter build() const;

    private:
        friend class FfiConverter;
        std::string crate_name_;
        Edition edition_ = Edition::Rust2021;
        std::vector<Path> allowed_prefixes_;
        std::vector<Path> transparent_wrappers_;
        std::vector<Path> prefixed_exported_types_;
    };

    static Builder builder(std::string source_crate_name) { return Builder(std::move(source_crate_name)); }

    explicit FfiConverter(const Builder& b);
    ~FfiConverter();
    FfiConverter(FfiConverter&&) noexcept;
    FfiConverter& operator=(FfiConverter&&) noexcept;

    // Advance by one output item; nullopt once everything was emitted.
    std::optional<Item> call(ItemSource& upstream);

    // Run all phases over `items`.
    std::vector<Item> convert_all(std::vector<Item> items);

    Phase phase() const;
    const ExportedTypeIndex& exported_types() const;
    const PrimitiveTable& primitive_types() const;
    const TransmutePairs& pairs() const;
    const std::string& crate_name() const;

private:
    struct State;
    void collect(ItemSource& upstream);
    Item convert_item(const Item& item);

    std::unique_ptr<State> st_;
};

} // namespace ffistub
