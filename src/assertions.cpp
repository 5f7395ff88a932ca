#include "ffistub/assertions.hpp"

namespace ffistub {

const char* const kSizeMismatchMessage = "Size mismatch between stub parameter type and source crate type";
const char* const kAlignMismatchMessage = "Alignment mismatch between stub parameter type and source crate type";

Declaration make_assertion(AssertionBody::Metric metric, type_ptr local, type_ptr origin){
    Declaration d;
    d.name = "_";
    d.body = AssertionBody{metric, std::move(local), std::move(origin),
                           metric==AssertionBody::Metric::Size ? kSizeMismatchMessage : kAlignMismatchMessage};
    return d;
}

std::vector<Item> generate_assertions(const TransmutePairs& pairs){
    std::vector<Item> out;
    for(auto& p: pairs.values()){
        if(p.local->is<BareFnType>() || p.origin->is<BareFnType>()) continue;
        out.push_back(Item{make_assertion(AssertionBody::Metric::Size, p.local, p.origin), p.location});
        out.push_back(Item{make_assertion(AssertionBody::Metric::Align, p.local, p.origin), p.location});
    }
    return out;
}

} // namespace ffistub
