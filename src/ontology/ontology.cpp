/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <ontology/ontology.hpp>

#include <string>

namespace taxmap::ontology {

auto Entry::empty() const
    -> bool
{
    return senses.empty();
}

auto relations( Sense const& sense )
    -> RelatedTermSet
{
    auto rv = RelatedTermSet{};

    for( auto const& e : sense.synonyms ) { rv.emplace( RelatedTerm{ e, Relation::synonym } ); }
    for( auto const& e : sense.hypernyms ) { rv.emplace( RelatedTerm{ e, Relation::hypernym } ); }
    for( auto const& e : sense.hyponyms ) { rv.emplace( RelatedTerm{ e, Relation::hyponym } ); }

    return rv;
}

auto relations( Entry const& entry )
    -> RelatedTermSet
{
    auto rv = RelatedTermSet{};

    for( auto const& sense : entry.senses )
    {
        rv.merge( relations( sense ) );
    }

    return rv;
}

auto invert( Relation const& relation )
    -> Relation
{
    switch( relation )
    {
        case Relation::synonym: return Relation::synonym;
        case Relation::hypernym: return Relation::hyponym;
        case Relation::hyponym: return Relation::hypernym;
    }

    return relation;
}

auto to_string( Relation const& relation )
    -> std::string
{
    switch( relation )
    {
        case Relation::synonym: return "synonym";
        case Relation::hypernym: return "hypernym";
        case Relation::hyponym: return "hyponym";
    }

    return "unknown";
}

} // namespace taxmap::ontology
