#include "deepcheck/collections.hpp"

namespace deepcheck {

const char* collection_verdict_kind_name(CollectionVerdictKind k){
    switch(k){
        case CollectionVerdictKind::AllFound: return "all-found";
        case CollectionVerdictKind::MissingElements: return "missing-elements";
        case CollectionVerdictKind::UnexpectedElements: return "unexpected-elements";
        case CollectionVerdictKind::OrderMismatch: return "order-mismatch";
    }
    return "unknown";
}

std::vector<value> expected_elements(const value& single){
    if(is_sequence(single)) return elements_of(single);
    return {single};
}

} // namespace deepcheck
