#ifndef BAYESNET_ENUM_MACROS_H
#define BAYESNET_ENUM_MACROS_H

// provide pieces for stringify-ing / parsing the closed enums of the BN namespace
#include <string>
#include <iostream>

#include <BayesNet/Errors.h>

namespace BN {

// templating tools to enable convenient "EnumType e = from_string(str);" syntax;
// every enum built with CONSTRUCTENUM specializes hidden_fs
template<class ET>
ET hidden_fs(const std::string &estr);

struct SEWrapper {
    const std::string str;
    SEWrapper(const std::string s) : str(s) {}
    template<typename T>
    operator T () const { return hidden_fs<T>(str); }
};

inline SEWrapper from_string(const std::string str) {
    return SEWrapper(str);
}

} // namespace BN

// fundamental tools
#define BN_CONCAT(a, b) BN_CONCAT_(a, b)
#define BN_CONCAT_(a, b) a ## b
#define BN_COMMA(X) X,
#define BN_QUOTE(X) #X

// these pieces are the typical Enum => String and vice versa bits
#define BN_SSTR(X) case X: return BN_QUOTE(X);
#define BN_STRTOE(X) if (estr == BN_QUOTE(X)) { return X; } else
// "and counter" enum style - i.e. last enum of an EnumType is N_EnumType
#define BN_N_ENUM(ET) BN_CONCAT(N_,ET)

// constructs an enum; the VA args should COMMA(Enum1) COMMA(Enum2) etc
#define BN_MAKE_ENUM(ET, ...) enum ET { \
  __VA_ARGS__ \
  BN_N_ENUM(ET) \
};

#define BN_STRINGIFY_ENUM(ET, switchblock)\
inline std::string to_string(const ET &e) { \
  switch (e) {\
    switchblock\
    default: break;\
  }\
  throw InvalidArgumentError("undefined " #ET " value: " + std::to_string(static_cast<int>(e))); \
}\
\
inline std::ostream& operator<<(std::ostream &out, const ET &e) { \
  return out << to_string(e); \
}

#define BN_PARSE_ENUM(ET, ifblock)\
template<>\
inline ET hidden_fs<ET>(const std::string &estr) { \
  ifblock \
  { \
    throw InvalidArgumentError("failed to parse " #ET " from: " + estr); \
  }\
}

// must be used inside namespace BN
#define BN_CONSTRUCTENUM(ENUMM)\
ENUMM(BN_MAKE_ENUM, BN_COMMA) \
ENUMM(BN_STRINGIFY_ENUM, BN_SSTR) \
ENUMM(BN_PARSE_ENUM, BN_STRTOE)

/* example usage - think of this as replacing normal Enum declaration
#define ENUMDEMO(MACRO, SUBM) MACRO(EnumDemo,SUBM(FOO) SUBM(BAR))
BN_CONSTRUCTENUM(ENUMDEMO)
*/

#endif // BAYESNET_ENUM_MACROS_H
