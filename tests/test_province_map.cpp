// tests/test_province_map.cpp (doctest)

#include <doctest/doctest.h>

#include <sstream>

#include "province_map.h"
#include "test_support.h"

using namespace provmap_test;

namespace {

ProvinceColorTable quadrantTable() {
    ProvinceColorTable table;
    table.add(1, kRed);
    table.add(2, kGreen);
    table.add(3, kBlue);
    table.add(4, kYellow);
    return table;
}

sf::Image quadrantImage(int n) {
    sf::Image image = makeImage(static_cast<unsigned int>(2 * n), static_cast<unsigned int>(2 * n), kRed);
    paintRect(image, n, 0, 2 * n, n, kGreen);
    paintRect(image, 0, n, n, 2 * n, kBlue);
    paintRect(image, n, n, 2 * n, 2 * n, kYellow);
    return image;
}

} // namespace

TEST_SUITE("province_map") {

TEST_CASE("quadrants segment into four provinces covering the image") {
    const int n = 3;
    const ProvinceColorTable table = quadrantTable();
    const ProvinceMap map(quadrantImage(n), table);

    const std::vector<Province>& provinces = map.getProvinces();
    REQUIRE(provinces.size() == 4);
    CHECK(map.getUnrecognizedColors().empty());

    // First-seen scan order.
    CHECK(provinces[0].id == 1);
    CHECK(provinces[1].id == 2);
    CHECK(provinces[2].id == 3);
    CHECK(provinces[3].id == 4);

    CHECK(map.findProvince(1)->boundingBox == PixelBox{0, 0, n, n});
    CHECK(map.findProvince(2)->boundingBox == PixelBox{n, 0, 2 * n, n});
    CHECK(map.findProvince(3)->boundingBox == PixelBox{0, n, n, 2 * n});
    CHECK(map.findProvince(4)->boundingBox == PixelBox{n, n, 2 * n, 2 * n});

    size_t covered = 0;
    for (const Province& province : provinces) {
        CHECK(province.mask.getWidth() == n);
        CHECK(province.mask.getHeight() == n);
        CHECK(province.mask.pixelCount() == static_cast<size_t>(n * n));
        covered += province.mask.pixelCount();
    }
    CHECK(covered == static_cast<size_t>(4 * n * n));
}

TEST_CASE("colours missing from the table produce no province") {
    ProvinceColorTable table;
    table.add(7, kRed);
    sf::Image image = makeImage(4, 2, kRed);
    paintRect(image, 2, 0, 4, 2, sf::Color(9, 9, 9));

    const ProvinceMap map(image, table);
    REQUIRE(map.getProvinces().size() == 1);
    const Province& province = map.getProvinces()[0];
    CHECK(province.id == 7);
    CHECK(province.boundingBox == PixelBox{0, 0, 2, 2});
    CHECK(province.mask.pixelCount() == 4);
    CHECK_FALSE(province.mask.contains(2, 0));

    REQUIRE(map.getUnrecognizedColors().size() == 1);
    CHECK(map.getUnrecognizedColors()[0].color == sf::Color(9, 9, 9));
    CHECK(map.getUnrecognizedColors()[0].pixelCount == 4);
}

TEST_CASE("disconnected pieces of one colour form a single province") {
    ProvinceColorTable table;
    table.add(1, kRed);
    table.add(2, kGreen);
    sf::Image image = makeImage(3, 1, kRed);
    image.setPixel(1, 0, kGreen);

    const ProvinceMap map(image, table);
    const Province* red = map.findProvince(1);
    REQUIRE(red != nullptr);
    CHECK(red->boundingBox == PixelBox{0, 0, 3, 1});
    CHECK(red->mask.contains(0, 0));
    CHECK_FALSE(red->mask.contains(1, 0));
    CHECK(red->mask.contains(2, 0));
    CHECK(red->mask.pixelCount() == 2);
    CHECK(map.findProvince(3) == nullptr);
}

TEST_CASE("mask rows are padded to whole bytes") {
    ProvinceMask mask(9, 2);
    CHECK(mask.getStride() == 2);
    CHECK(mask.getBits().size() == 4);
    mask.set(8, 1);
    CHECK(mask.contains(8, 1));
    CHECK_FALSE(mask.contains(7, 1));
    CHECK_FALSE(mask.contains(9, 1));
    CHECK(mask.getBits()[3] == 0x80);
}

TEST_CASE("doubling scales image, boxes and masks") {
    const ProvinceColorTable table = quadrantTable();
    const ProvinceMap map(quadrantImage(2), table);
    const ProvinceMap doubled = map.doubled();

    CHECK(doubled.getWidth() == 8);
    CHECK(doubled.getHeight() == 8);
    CHECK(doubled.getImage().getPixel(7, 7) == kYellow);
    CHECK(doubled.getImage().getPixel(3, 3) == kRed);

    const Province* yellow = doubled.findProvince(4);
    REQUIRE(yellow != nullptr);
    CHECK(yellow->boundingBox == PixelBox{4, 4, 8, 8});
    CHECK(yellow->mask.pixelCount() == 16);
}

TEST_CASE("definition csv skips malformed rows and tolerates trailing letters") {
    std::istringstream csv(
        "province;red;green;blue;x;x\n"
        "1;128;34;64;Stockholm;x\n"
        "2;0;36;128;Ostergotland;x\r\n"
        "3;104o;12;5;Smaland;x\n"
        "4;;1;2;Broken;x\n"
        "5;1;2\n"
        "x6;1;2;3;NotAnId;x\n");
    ProvinceColorTable table;
    std::string err;
    REQUIRE(table.loadFromCsvStream(csv, &err));
    CHECK(table.size() == 3);
    REQUIRE(table.findColor(3) != nullptr);
    CHECK(*table.findColor(3) == sf::Color(104, 12, 5));
    REQUIRE(table.findColor(2) != nullptr);
    CHECK(*table.findColor(2) == sf::Color(0, 36, 128));
    CHECK(table.findColor(4) == nullptr);
    CHECK(table.findColor(5) == nullptr);

    int id = 0;
    CHECK(table.findProvince(sf::Color(128, 34, 64), id));
    CHECK(id == 1);
}

TEST_CASE("a later row rebinds a colour already in use") {
    ProvinceColorTable table;
    table.add(1, kRed);
    table.add(2, kRed);
    int id = 0;
    REQUIRE(table.findProvince(kRed, id));
    CHECK(id == 2);
    REQUIRE(table.findColor(1) != nullptr);
    CHECK(*table.findColor(1) == kRed);
    CHECK(table.size() == 2);

    // The pixels belong to the later id only.
    const ProvinceMap provinces(makeImage(2, 2, kRed), table);
    REQUIRE(provinces.getProvinces().size() == 1);
    CHECK(provinces.getProvinces()[0].id == 2);
    CHECK(provinces.findProvince(1) == nullptr);
}

TEST_CASE("missing definition file reports an error") {
    ProvinceColorTable table;
    std::string err;
    CHECK_FALSE(table.loadFromCsvFile("does/not/exist.csv", &err));
    CHECK(err.find("does/not/exist.csv") != std::string::npos);
}

} // TEST_SUITE
