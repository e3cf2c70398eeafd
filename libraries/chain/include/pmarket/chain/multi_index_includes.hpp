#pragma once

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace bmi = boost::multi_index;
using bmi::indexed_by;
using bmi::ordered_unique;
using bmi::composite_key;
using bmi::member;
using bmi::tag;

struct by_id;

namespace pmarket { namespace chain {

   struct by_account;
   struct by_token_owner;
   struct by_token_owner_spender;

} } // namespace pmarket::chain
