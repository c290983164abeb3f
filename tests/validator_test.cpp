#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "argspec/definition_set.hpp"
#include "argspec/errors.hpp"
#include "argspec/tokenizer.hpp"
#include "argspec/validator.hpp"

using argspec::DefinitionSet;
using argspec::Definitions;
using argspec::OptionValue;
using argspec::RequireTarget;
using argspec::Tokenizer;
using argspec::ValidationError;
using argspec::Validator;

namespace {

OptionValue resolveOne(const std::string& spec, const std::vector<std::string>& tokens) {
    const auto set = DefinitionSet::build({{"a", spec}});
    const auto args = Tokenizer(set).tokenize(tokens);
    return Validator(set, args).resolve(set.begin()->second);
}

Validator::Resolved validate(const Definitions& definitions,
                             const std::vector<std::string>& tokens,
                             Validator::Options options = Validator::Options{}) {
    const auto set = DefinitionSet::build(definitions);
    const auto args = Tokenizer(set).tokenize(tokens);
    return Validator(set, args, options).validate();
}

// Message of the ValidationError thrown by resolveOne, or "" when nothing was thrown.
std::string resolveError(const std::string& spec, const std::vector<std::string>& tokens) {
    try {
        (void)resolveOne(spec, tokens);
    } catch (const ValidationError& e) {
        return e.what();
    }
    return {};
}

std::string validateError(const Definitions& definitions,
                          const std::vector<std::string>& tokens,
                          Validator::Options options = Validator::Options{}) {
    try {
        (void)validate(definitions, tokens, options);
    } catch (const ValidationError& e) {
        return e.what();
    }
    return {};
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(Validator, ImplicitDefaults) {
    EXPECT_TRUE(std::holds_alternative<std::monostate>(resolveOne("--a:string", {})));
    EXPECT_TRUE(std::get<std::vector<std::string>>(resolveOne("--a:string[]", {})).empty());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(resolveOne("--a:number", {})));
    EXPECT_TRUE(std::get<std::vector<double>>(resolveOne("--a:number[]", {})).empty());
    EXPECT_FALSE(std::get<bool>(resolveOne("--a:boolean", {})));
}

TEST(Validator, DefaultIsSubstitutedOnlyWhenAbsent) {
    EXPECT_EQ(std::get<double>(resolveOne("--a:number=42", {})), 42.0);
    EXPECT_EQ(std::get<double>(resolveOne("--a:number=42", {"--a=7"})), 7.0);
    EXPECT_EQ(std::get<std::vector<double>>(resolveOne("-n,--num:number[]=[1,2]", {})), (std::vector<double>{1, 2}));
    EXPECT_EQ(std::get<std::vector<double>>(resolveOne("-n,--num:number[]=[1,2]", {"-n", "3"})),
              (std::vector<double>{3}));
}

TEST(Validator, BooleanPresence) {
    EXPECT_TRUE(std::get<bool>(resolveOne("-a,--foo:boolean", {"--foo"})));
    EXPECT_TRUE(std::get<bool>(resolveOne("-a,--foo:boolean", {"-a"})));
}

TEST(Validator, ArrayAccumulatesLongBeforeShort) {
    EXPECT_EQ(std::get<std::vector<double>>(resolveOne("-f,--foo:number[]", {"--foo=1", "-f", "2"})),
              (std::vector<double>{1, 2}));
    EXPECT_EQ(std::get<std::vector<double>>(resolveOne("-f,--foo:number[]", {"-f", "2", "--foo=1"})),
              (std::vector<double>{1, 2}));
    EXPECT_EQ(std::get<std::vector<std::string>>(resolveOne("-t,--tag:string[]", {"-t", "b", "--tag", "a", "-tc"})),
              (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Validator, NumberLikeStringIsCoercedBackToText) {
    for (const std::vector<std::string>& tokens : {std::vector<std::string>{"--str=1"},
                                                    std::vector<std::string>{"-s", "1"},
                                                    std::vector<std::string>{"-s1"}}) {
        EXPECT_EQ(std::get<std::string>(resolveOne("-s,--str:string", tokens)), "1");
    }
    EXPECT_EQ(std::get<std::string>(resolveOne("-s,--str:string", {"--str=1.50"})), "1.50");
    EXPECT_EQ(std::get<std::string>(resolveOne("-s,--str:string", {"--str", "0x10"})), "0x10");
}

TEST(Validator, NumberLikeStringArrayIsCoercedBackToText) {
    for (const std::vector<std::string>& tokens : {std::vector<std::string>{"--str=1", "--str=2"},
                                                    std::vector<std::string>{"-s", "1", "-s", "2"},
                                                    std::vector<std::string>{"-s1", "-s2"}}) {
        EXPECT_EQ(std::get<std::vector<std::string>>(resolveOne("-s,--str:string[]", tokens)),
                  (std::vector<std::string>{"1", "2"}));
    }
}

TEST(Validator, EmptyStrings) {
    EXPECT_EQ(std::get<std::string>(resolveOne("--str:string", {"--str="})), "");
    EXPECT_EQ(std::get<std::vector<std::string>>(resolveOne("--str:string[]", {"--str=", "--str="})),
              (std::vector<std::string>{"", ""}));
}

TEST(Validator, SingleValueForArrayTypes) {
    EXPECT_EQ(std::get<std::vector<std::string>>(resolveOne("--a:string[]", {"--a=1"})), (std::vector<std::string>{"1"}));
    EXPECT_EQ(std::get<std::vector<double>>(resolveOne("--a:number[]", {"--a=1"})), (std::vector<double>{1}));
}

TEST(Validator, RequiredScalarsMustBeGiven) {
    EXPECT_FALSE(resolveError("--a:number!", {}).empty());
    EXPECT_FALSE(resolveError("--a:string!", {}).empty());

    const auto message = resolveError("-a,--foo:number!", {});
    EXPECT_EQ(message, "-a, --foo is required");
    EXPECT_TRUE(contains(message, "-a"));
    EXPECT_TRUE(contains(message, "--foo"));
    EXPECT_TRUE(contains(message, "required"));
}

TEST(Validator, RequiredTypesWithNonNullDefaultsNeverGoMissing) {
    EXPECT_FALSE(std::get<bool>(resolveOne("--a:boolean!", {})));
    EXPECT_TRUE(std::get<std::vector<double>>(resolveOne("--a:number[]!", {})).empty());
    EXPECT_TRUE(std::get<std::vector<std::string>>(resolveOne("--a:string[]!", {})).empty());
}

TEST(Validator, BooleanMustBeABareSwitch) {
    EXPECT_EQ(resolveError("-a,--foo:boolean", {"--foo="}), "--foo is a boolean switch and must not have a value (got \"\")");
    EXPECT_EQ(resolveError("-a,--foo:boolean", {"--foo=yes"}),
              "--foo is a boolean switch and must not have a value (got \"yes\")");
    EXPECT_EQ(resolveError("-a,--foo:boolean", {"-a1"}), "-a is a boolean switch and must not have a value (got \"1\")");
}

TEST(Validator, BooleanValueAfterTerminatorIsInert) {
    const auto set = DefinitionSet::build({{"s", "-a,--foo:boolean"}});
    const auto args = Tokenizer(set).tokenize({"--", "--foo=x", "-a1"});
    const auto resolved = Validator(set, args).validate();
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_FALSE(std::get<bool>(resolved[0].second));
    EXPECT_EQ(args.rest, (std::vector<std::string>{"--foo=x", "-a1"}));
}

TEST(Validator, NonBooleanWithoutValue) {
    for (const char* spec : {"--a:number", "--a:number[]", "--a:string", "--a:string[]"}) {
        EXPECT_EQ(resolveError(spec, {"--a"}), "--a needs a value") << spec;
    }
    for (const char* spec : {"-a,--foo:number", "-a,--foo:number[]", "-a,--foo:string", "-a,--foo:string[]"}) {
        EXPECT_EQ(resolveError(spec, {"-a"}), "-a needs a value") << spec;
    }
}

TEST(Validator, MultipleValuesForScalarTypes) {
    EXPECT_EQ(resolveError("--a:string", {"--a=foo", "--a=bar"}), "--a should not have multiple values");
    EXPECT_EQ(resolveError("-a,--aa:string", {"-a", "foo", "--aa=bar"}), "-a, --aa should not have multiple values");
    EXPECT_EQ(resolveError("-a,--aa:number", {"-a", "1", "--aa=2"}), "-a, --aa should not have multiple values");
    EXPECT_EQ(resolveError("--a:boolean", {"--a", "--a"}), "--a should not have multiple values");
    EXPECT_FALSE(resolveError("-a,--aa:number", {"-a", "1,--aa=2"}).empty());
}

TEST(Validator, NumbersMustBeNumeric) {
    EXPECT_EQ(resolveError("--n:number", {"--n=abc"}), "--n should be a number (got \"abc\")");
    EXPECT_EQ(resolveError("--n:number", {"--n="}), "--n should be a number (got \"\")");
    EXPECT_EQ(resolveError("--n:number[]", {"--n=1", "--n=x"}), "all values of --n should be numbers (got \"x\")");
    EXPECT_EQ(std::get<double>(resolveOne("--n:number", {"--n=-1.5e1"})), -15.0);
    EXPECT_EQ(std::get<double>(resolveOne("--n:number", {"--n=0x1F"})), 31.0);
}

TEST(Validator, UnknownOption) {
    EXPECT_EQ(validateError({{"a", "--foo:string"}}, {"--bar"}), "unknown option: --bar");

    Validator::Options quiet;
    quiet.suggestOptions = false;
    EXPECT_EQ(validateError({{"a", "-a,--foo:boolean"}}, {"-x"}, quiet), "unknown option: -x");
}

TEST(Validator, UnknownOptionSuggestsCloseNames) {
    const auto message = validateError({{"a", "--foo:string"}, {"b", "--verbose:boolean"}}, {"--fo"});
    EXPECT_EQ(message, "unknown option: --fo\n\nDid you mean this?\n  --foo");
}

TEST(Validator, UnknownOptionsCanBeAllowed) {
    Validator::Options options;
    options.allowUnknownOptions = true;
    const auto resolved = validate({{"a", "--foo:string"}}, {"--bar", "--foo=x"}, options);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(std::get<std::string>(resolved[0].second), "x");
}

TEST(Validator, OptionErrorsComeBeforeUnknownOptions) {
    EXPECT_EQ(validateError({{"a", "--foo:number!"}}, {"--bar"}), "--foo is required");
}

TEST(Validator, FirstFailingKeyWins) {
    EXPECT_EQ(validateError({{"x", "--x:number!"}, {"y", "--y:number!"}}, {}), "--x is required");
    EXPECT_EQ(validateError({{"y", "--y:number!"}, {"x", "--x:number!"}}, {}), "--y is required");
}

TEST(Validator, RequireTarget) {
    Validator::Options generic;
    generic.requireTarget = RequireTarget::on();
    EXPECT_EQ(validateError({}, {}, generic), "a target is required");
    EXPECT_EQ(validateError({}, {"--", "x"}, generic), "a target is required");
    EXPECT_EQ(validateError({}, {"file"}, generic), "");

    Validator::Options custom;
    custom.requireTarget = RequireTarget::on("give me a file");
    EXPECT_EQ(validateError({}, {}, custom), "give me a file");

    EXPECT_EQ(validateError({}, {}), "");
}

TEST(Validator, ResolvedKeepsDefinitionOrder) {
    const auto resolved = validate({{"z", "--z:boolean"}, {"a", "--a:number=1"}, {"m", "--m:string"}}, {"--z"});
    ASSERT_EQ(resolved.size(), 3u);
    EXPECT_EQ(resolved[0].first, "z");
    EXPECT_EQ(resolved[1].first, "a");
    EXPECT_EQ(resolved[2].first, "m");
    EXPECT_TRUE(std::get<bool>(resolved[0].second));
}

TEST(Validator, IsSwitchedOn) {
    const auto set = DefinitionSet::build({{"help", "-h,--help:boolean"}, {"on", "--on:boolean=true"}, {"n", "--n:number"}});
    const auto given = Tokenizer(set).tokenize({"-h"});
    EXPECT_TRUE(Validator(set, given).isSwitchedOn(*set.find("help")));
    EXPECT_TRUE(Validator(set, given).isSwitchedOn(*set.find("on")));
    EXPECT_FALSE(Validator(set, given).isSwitchedOn(*set.find("n")));

    const auto misused = Tokenizer(set).tokenize({"--help=1"});
    EXPECT_FALSE(Validator(set, misused).isSwitchedOn(*set.find("help")));

    const auto absent = Tokenizer(set).tokenize({});
    EXPECT_FALSE(Validator(set, absent).isSwitchedOn(*set.find("help")));
}
