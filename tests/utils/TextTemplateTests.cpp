/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TextTemplateTests
#include <boost/test/unit_test.hpp>

#include "utils/TextTemplate.hpp"

using namespace Realmforge;

BOOST_AUTO_TEST_SUITE(FillTemplateTests)

BOOST_AUTO_TEST_CASE(TestKnownPlaceholdersAreReplaced) {
    const TemplateValues values{{"quality", "fine"}, {"material", "iron"}};
    BOOST_CHECK_EQUAL(fillTemplate("A {quality} {material} blade", values),
                      "A fine iron blade");
    BOOST_CHECK_EQUAL(fillTemplate("{material}, {material} and {material}", values),
                      "iron, iron and iron");
}

BOOST_AUTO_TEST_CASE(TestUnknownPlaceholdersAreStripped) {
    const TemplateValues values{{"name", "Brenna"}};
    BOOST_CHECK_EQUAL(fillTemplate("{name} the {title}", values), "Brenna the ");
    BOOST_CHECK_EQUAL(fillTemplate("{unknown}", {}), "");
}

BOOST_AUTO_TEST_CASE(TestStrayBracesSurvive) {
    BOOST_CHECK_EQUAL(fillTemplate("empty {} braces", {}), "empty {} braces");
    BOOST_CHECK_EQUAL(fillTemplate("open { only", {}), "open { only");
}

BOOST_AUTO_TEST_CASE(TestValueContainingPlaceholderIsNotExpandedAgain) {
    const TemplateValues values{{"a", "{a}"}};
    BOOST_CHECK_EQUAL(fillTemplate("x{a}y", values), "xy");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CaseTests)

BOOST_AUTO_TEST_CASE(TestCapitalizeAndLower) {
    BOOST_CHECK_EQUAL(capitalize("forest clearing"), "Forest clearing");
    BOOST_CHECK_EQUAL(capitalize(""), "");
    BOOST_CHECK_EQUAL(toLower("Temperate FOREST"), "temperate forest");
}

BOOST_AUTO_TEST_SUITE_END()
