#pragma once
#include "ffistub/ast.hpp"
#include "ffistub/record.hpp"
#include <set>
#include <string>
#include <vector>

namespace rustdecl {

// Declarations of one source crate, loaded from record files (possibly sharded).
// Each record is parsed into exactly one declaration of the recorded kind and name;
// records repeated verbatim across shards are loaded once.
class Source {
public:
    explicit Source(std::string crate_name) : crate_(std::move(crate_name)) {}

    Source& add_records(const std::vector<ffistub::Record>& records);
    Source& add_file(const std::string& path);

    const std::string& crate_name() const { return crate_; }
    size_t size() const { return items_.size(); }
    const std::vector<ffistub::Item>& items() const { return items_; }

    // Stream over a copy of the loaded items, in load order.
    ffistub::ItemSource stream() const { return ffistub::from_items(items_); }

private:
    ffistub::Item load(const ffistub::Record& r) const;

    std::string crate_;
    std::vector<ffistub::Item> items_;
    std::set<std::string> seen_;
};

} // namespace rustdecl
