/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "test/util.hpp"

#include <error/ontology.hpp>
#include <util/result.hpp>

namespace taxmap::test {

auto make_grocery_ontology()
    -> ontology::MemoryOntology
{
    auto rv = ontology::MemoryOntology{};

    rv.add_synonyms( { "sofa", "couch" }, "an upholstered seat for more than one person" );
    rv.add_sense( "cheese"
                , ontology::Sense{ .gloss = "a very important person; the boss"
                                 , .synonyms = { "big shot", "boss" } } );
    rv.add_sense( "cheese"
                , ontology::Sense{ .gloss = "solid food prepared from the pressed curds of milk"
                                 , .hypernyms = { "dairy product", "food" }
                                 , .hyponyms = { "cottage cheese", "ricotta" } } );
    rv.add_sense( "cheddar"
                , ontology::Sense{ .gloss = "hard smooth cheese originally made in Cheddar"
                                 , .hypernyms = { "cheese" } } );
    rv.add_sense( "milk"
                , ontology::Sense{ .gloss = "white nutritious liquid secreted by mammals"
                                 , .hypernyms = { "dairy product", "beverage" } } );

    return rv;
}

auto make_term_set( TermSet const& category
                  , TermSet const& parent
                  , std::vector< TermSet > const& children )
    -> ExtendedTermSet
{
    return ExtendedTermSet{ .category = category
                          , .parent = parent
                          , .children = children };
}

auto FailingOntology::lookup( Term const& term ) const
    -> Result< ontology::Entry >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "term", term );

    return TAXMAP_MAKE_ERROR_MSG( error_code::ontology::unavailable, term );
}

FlakyOntology::FlakyOntology( ontology::Ontology const& backing
                            , uint32_t const failures )
    : backing_{ backing }
    , failures_{ failures }
{
}

auto FlakyOntology::calls() const
    -> uint32_t
{
    return calls_.load();
}

auto FlakyOntology::lookup( Term const& term ) const
    -> Result< ontology::Entry >
{
    TM_RESULT_PROLOG();
        TM_RESULT_PUSH( "term", term );

    if( calls_.fetch_add( 1 ) < failures_ )
    {
        return TAXMAP_MAKE_ERROR_MSG( error_code::ontology::lookup_failed, term );
    }

    return TTRY( backing_.lookup( term ) );
}

} // namespace taxmap::test
