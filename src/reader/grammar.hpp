#pragma once
#include <tao/pegtl.hpp>

namespace backport::reader::grammar {
using namespace tao::pegtl;

// Comments and whitespace; commas count as whitespace as in EDN
struct comment : seq< one<';'>, until< eolf > > {};
struct separator : sor< space, one<','>, comment > {};
struct seps : star< separator > {};

struct sym_first : sor< alpha, one<'_'> > {};
struct sym_rest : sor< alnum, one<'_', '.', '-'> > {};
struct symbol : seq< sym_first, star< sym_rest > > {};
struct keyword_name : seq< sym_first, star< sym_rest > > {};
struct keyword : seq< one<':'>, keyword_name > {};

struct nil_lit : seq< TAO_PEGTL_STRING("nil"), not_at< sym_rest > > {};
struct true_lit : seq< TAO_PEGTL_STRING("true"), not_at< sym_rest > > {};
struct false_lit : seq< TAO_PEGTL_STRING("false"), not_at< sym_rest > > {};

struct sign : opt< one<'-', '+'> > {};
struct digits : plus< digit > {};
struct exponent : seq< one<'e', 'E'>, opt< one<'-', '+'> >, digits > {};
struct fraction : seq< one<'.'>, star< digit > > {};
struct float_lit : seq< sign, digits, sor< seq< fraction, opt< exponent > >, exponent > > {};
struct integer_lit : seq< sign, digits, not_at< sym_rest > > {};

struct escaped : seq< one<'\\'>, any > {};
struct plain : not_one<'"', '\\'> {};
struct string_lit : seq< one<'"'>, star< sor< escaped, plain > >, must< one<'"'> > > {};

struct value;
struct list_open : one<'('> {};
struct list_close : one<')'> {};
struct vector_open : one<'['> {};
struct vector_close : one<']'> {};
struct list_form : seq< list_open, seps, star< value, seps >, must< list_close > > {};
struct vector_form : seq< vector_open, seps, star< value, seps >, must< vector_close > > {};

struct value : sor< list_form, vector_form, string_lit, float_lit, integer_lit, keyword,
                    nil_lit, true_lit, false_lit, symbol > {};

struct document : must< seps, value, seps, eof > {};

} // namespace backport::reader::grammar
