/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <match/disambiguate.hpp>

#include <term_set.hpp>
#include <util/edit_distance.hpp>

#include <range/v3/view/enumerate.hpp>

namespace taxmap {

namespace {

auto sense_vocabulary( ontology::Sense const& sense
                     , TermPolicy const& policy )
    -> TermSet
{
    auto rv = split_terms( sense.gloss, policy );

    for( auto const& related : ontology::relations( sense ) )
    {
        rv.merge( split_terms( related.term, policy ) );
    }

    return rv;
}

} // namespace anon

auto sense_score( ontology::Sense const& sense
                , TermSet const& context
                , double const min_overlap
                , TermPolicy const& policy )
    -> double
{
    auto rv = 0.0;

    for( auto const& word : sense_vocabulary( sense, policy ) )
    {
        for( auto const& cterm : context )
        {
            if( auto const overlap = util::common_substring_ratio( word, cterm )
              ; overlap >= min_overlap && overlap > 0.0 )
            {
                rv += overlap;
            }
        }
    }

    return rv;
}

auto disambiguate( ontology::Entry const& entry
                 , TermSet const& context
                 , double const min_overlap
                 , TermPolicy const& policy )
    -> Optional< uint32_t >
{
    auto rv = Optional< uint32_t >{};

    if( entry.senses.size() < 2 || context.empty() )
    {
        return rv;
    }

    auto best = 0.0;

    for( auto const& [ index, sense ] : entry.senses | ranges::views::enumerate )
    {
        if( auto const score = sense_score( sense, context, min_overlap, policy )
          ; score > best )
        {
            best = score;
            rv = static_cast< uint32_t >( index );
        }
    }

    return rv;
}

} // namespace taxmap
