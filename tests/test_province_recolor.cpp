// tests/test_province_recolor.cpp (doctest)

#include <doctest/doctest.h>

#include "border_renderer.h"
#include "province_recolor.h"
#include "test_support.h"

using namespace provmap_test;

namespace {

struct QuadrantMap {
    ProvinceColorTable table;
    ProvinceMap provinces;

    QuadrantMap() {
        table.add(1, kRed);
        table.add(2, kGreen);
        table.add(3, kBlue);
        table.add(4, kYellow);
        sf::Image image = makeImage(4, 4, kRed);
        paintRect(image, 2, 0, 4, 2, kGreen);
        paintRect(image, 0, 2, 2, 4, kBlue);
        paintRect(image, 2, 2, 4, 4, kYellow);
        image.setPixel(3, 3, sf::Color(1, 2, 3)); // unrecognised
        provinces = ProvinceMap(image, table);
    }
};

} // namespace

TEST_SUITE("province_recolor") {

TEST_CASE("explicit colours replace provinces and unknown ids are ignored") {
    const QuadrantMap map;
    ProvinceRecolor recolor(map.table);
    CHECK(recolor.set(1, sf::Color::Black));
    CHECK_FALSE(recolor.set(99, sf::Color::Black));

    const sf::Image out = recolor.generate(map.provinces);
    CHECK(out.getPixel(0, 0) == sf::Color::Black);
    CHECK(out.getPixel(1, 1) == sf::Color::Black);
    CHECK(out.getPixel(2, 0) == kGreen);
    CHECK(out.getPixel(3, 3) == sf::Color(1, 2, 3));
}

TEST_CASE("shades of white are unique and avoid explicit colours") {
    const QuadrantMap map;
    ProvinceRecolor recolor(map.table, ProvinceRecolor::Special::ShadesOfWhite);
    recolor.set(1, sf::Color::Black);
    recolor.set(2, sf::Color::White);

    const sf::Image out = recolor.generate(map.provinces);
    CHECK(out.getPixel(2, 0) == sf::Color::White);
    CHECK(out.getPixel(0, 2) == sf::Color(255, 255, 254));
    CHECK(out.getPixel(2, 2) == sf::Color(255, 255, 253));
}

TEST_CASE("shades of white avoid colours of kept provinces") {
    ProvinceColorTable table;
    table.add(1, sf::Color::White);
    table.add(2, kRed);
    sf::Image image = makeImage(2, 1, sf::Color::White);
    image.setPixel(1, 0, kRed);
    const ProvinceMap provinces(image, table);

    ProvinceRecolor recolor(table, ProvinceRecolor::Special::ShadesOfWhite);
    recolor.set(1, ProvinceRecolor::Special::Keep);
    const sf::Image out = recolor.generate(provinces);
    CHECK(out.getPixel(0, 0) == sf::Color::White);
    CHECK(out.getPixel(1, 0) == sf::Color(255, 255, 254));

    // The two provinces must stay apart for the border renderer.
    const sf::Image borders = renderDoubleBorders(out);
    CHECK(isBorder(borders, 0, 0));
    CHECK(isBorder(borders, 1, 0));

    // Same when Keep is the default rather than set per province.
    ProvinceRecolor keepByDefault(table);
    keepByDefault.set(2, ProvinceRecolor::Special::ShadesOfWhite);
    CHECK(keepByDefault.generate(provinces).getPixel(1, 0) == sf::Color(255, 255, 254));
}

TEST_CASE("special colours per province") {
    const QuadrantMap map;
    ProvinceRecolor recolor(map.table, ProvinceRecolor::Special::Transparent);
    recolor.set(4, ProvinceRecolor::Special::Keep);

    const sf::Image out = recolor.generate(map.provinces);
    CHECK(out.getPixel(0, 0).a == 0);
    CHECK(out.getPixel(2, 0).a == 0);
    CHECK(out.getPixel(2, 2) == kYellow);

    recolor.setDefault(ProvinceRecolor::Special::Keep);
    CHECK(recolor.generate(map.provinces).getPixel(0, 0) == kRed);
}

} // TEST_SUITE
