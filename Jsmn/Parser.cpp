#include<algorithm>
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Token.hpp"
#include"Jsmn/Detail/Type.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<memory>
#include<vector>

/* jsmn has all its code in the jsmn.h header, so instantiate all its
 * code into this compilation unit.
 */
#define JSMN_STATIC 1		/* Everything in this compilation unit.  */
#undef JSMN_HEADER		/* Not header-only.  */
#define JSMN_PARENT_LINKS 1	/* Faster parsing for more memory use.  */
#define JSMN_STRICT 1		/* Reject sloppy JSON.  */
# include <jsmn.h>

namespace {

/* Convert from jsmn.h types to Jsmn::Detail::Type.  */
Jsmn::Detail::Type type_convert(jsmntype_t t) {
	switch (t) {
	case JSMN_UNDEFINED: return Jsmn::Detail::Undefined;
	case JSMN_OBJECT: return Jsmn::Detail::Object;
	case JSMN_ARRAY: return Jsmn::Detail::Array;
	case JSMN_STRING: return Jsmn::Detail::String;
	case JSMN_PRIMITIVE: return Jsmn::Detail::Primitive;
	}
	return Jsmn::Detail::Undefined;
}
/* Convert from jsmn.h tokens to Jsmn::Detail::Token.  */
Jsmn::Detail::Token token_convert(jsmntok_t const& tok) {
	auto ret = Jsmn::Detail::Token();
	ret.type = type_convert(tok.type);
	ret.start = tok.start;
	ret.end = tok.end;
	ret.size = tok.size;
	return ret;
}

/* Initial token count, enough for most small
 * responses.  */
auto constexpr initial_tokens = std::size_t(64);

}

namespace Jsmn {

std::string ParseError::enmessage(std::string const& input, unsigned int i) {
	/* Show a little of the input around the error.  */
	auto constexpr context = 16u;
	auto b = (i > context) ? (i - context) : 0u;
	auto e = std::min<std::size_t>(input.size(), i + context);
	return std::string("JSON parse error at offset ")
	     + std::to_string(i)
	     + std::string(" near: ")
	     + input.substr(b, e - b)
	     ;
}

Jsmn::Object parse(std::string const& s) {
	/* In strict mode a primitive is only complete once
	 * something follows it.  */
	auto pr = std::make_shared<Detail::ParseResult>();
	pr->orig_string = s + "\n";
	auto const& input = pr->orig_string;

	auto toks = std::vector<jsmntok_t>(initial_tokens);
	auto base = jsmn_parser();
	auto res = int();
	for (;;) {
		jsmn_init(&base);
		res = jsmn_parse( &base
				, input.data(), input.size()
				, &toks[0], toks.size()
				);
		if (res != JSMN_ERROR_NOMEM)
			break;
		toks.resize(toks.size() * 2);
	}
	switch (res) {
	case JSMN_ERROR_INVAL:
		throw ParseError(s, base.pos);
	case JSMN_ERROR_PART:
	case 0:
		throw ParseError(s, (unsigned int) s.size());
	default:
		break;
	}

	pr->tokens.resize(res);
	for (auto i = 0; i < res; ++i)
		pr->tokens[i] = token_convert(toks[i]);

	/* The first datum must account for every token.  */
	Detail::Token const* tokptr = &pr->tokens[0];
	Detail::Token::next(tokptr);
	auto used = tokptr - &pr->tokens[0];
	if (used != res)
		throw ParseError(s, (unsigned int) pr->tokens[used].start);

	return Object(std::move(pr), 0);
}

}
