#include "province_map.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

std::vector<std::string> splitRow(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, delimiter)) {
        fields.push_back(field);
    }
    return fields;
}

std::string trimAscii(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool parseId(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const long long v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// The game's CSV reader drops trailing non-digits from numbers ("104o" reads as 104).
bool parseColorComponent(std::string s, sf::Uint8& out) {
    while (!s.empty() && !std::isdigit(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    if (s.empty()) return false;
    int v = 0;
    if (!parseId(s, v) || v < 0 || v > 255) return false;
    out = static_cast<sf::Uint8>(v);
    return true;
}

sf::Color opaque(const sf::Color& c) {
    return sf::Color(c.r, c.g, c.b);
}

} // namespace

void ProvinceColorTable::add(int provinceId, const sf::Color& color) {
    const sf::Color key = opaque(color);
    auto previous = m_colorById.find(provinceId);
    if (previous != m_colorById.end()) {
        auto byColor = m_idByColor.find(previous->second);
        if (byColor != m_idByColor.end() && byColor->second == provinceId) {
            m_idByColor.erase(byColor);
        }
    }
    // An id whose colour is taken over keeps its own entry, so findColor() still answers for it
    // while the map's pixels go to the later id. The game reads its definition file the same way.
    m_colorById[provinceId] = key;
    m_idByColor[key] = provinceId;
}

bool ProvinceColorTable::loadFromCsvFile(const std::string& path, std::string* errorMessage) {
    std::ifstream in(path);
    if (!in) {
        if (errorMessage) {
            *errorMessage = "Failed to open province definition '" + path + "'";
        }
        return false;
    }
    return loadFromCsvStream(in, errorMessage);
}

bool ProvinceColorTable::loadFromCsvStream(std::istream& in, std::string* errorMessage) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const std::vector<std::string> fields = splitRow(line, ';');
        if (fields.size() < 5) {
            continue;
        }
        const std::string idField = trimAscii(fields[0]);
        const std::string rField = trimAscii(fields[1]);
        const std::string gField = trimAscii(fields[2]);
        const std::string bField = trimAscii(fields[3]);
        if (idField.empty() || rField.empty() || gField.empty() || bField.empty()) {
            continue;
        }
        int provinceId = 0;
        if (!parseId(idField, provinceId)) {
            continue; // header row
        }
        sf::Color color;
        if (!parseColorComponent(rField, color.r) ||
            !parseColorComponent(gField, color.g) ||
            !parseColorComponent(bField, color.b)) {
            continue;
        }
        add(provinceId, color);
    }
    if (in.bad()) {
        if (errorMessage) {
            *errorMessage = "I/O error while reading province definition";
        }
        return false;
    }
    return true;
}

const sf::Color* ProvinceColorTable::findColor(int provinceId) const {
    auto it = m_colorById.find(provinceId);
    return it == m_colorById.end() ? nullptr : &it->second;
}

bool ProvinceColorTable::findProvince(const sf::Color& color, int& provinceId) const {
    auto it = m_idByColor.find(opaque(color));
    if (it == m_idByColor.end()) {
        return false;
    }
    provinceId = it->second;
    return true;
}

ProvinceMask::ProvinceMask(int width, int height)
    : m_width(width),
      m_height(height),
      m_stride((width + 7) / 8),
      m_bits(static_cast<size_t>((width + 7) / 8) * static_cast<size_t>(height), 0) {}

size_t ProvinceMask::pixelCount() const {
    size_t count = 0;
    for (std::uint8_t byte : m_bits) {
        while (byte) {
            byte = static_cast<std::uint8_t>(byte & (byte - 1));
            ++count;
        }
    }
    return count;
}

ProvinceMask ProvinceMask::doubled() const {
    ProvinceMask out(m_width * 2, m_height * 2);
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            if (!contains(x, y)) continue;
            out.set(2 * x, 2 * y);
            out.set(2 * x + 1, 2 * y);
            out.set(2 * x, 2 * y + 1);
            out.set(2 * x + 1, 2 * y + 1);
        }
    }
    return out;
}

ProvinceMap::ProvinceMap(const sf::Image& image, const ProvinceColorTable& colorTable)
    : m_image(image) {
    const int width = static_cast<int>(image.getSize().x);
    const int height = static_cast<int>(image.getSize().y);
    const sf::Uint8* pixels = image.getPixelsPtr();

    struct ColorGroup {
        sf::Color color;
        PixelBox box{std::numeric_limits<int>::max(), std::numeric_limits<int>::max(), 0, 0};
        size_t pixelCount = 0;
    };

    // Pass 1: group pixels by exact colour, tracking the bounding box of each group.
    std::vector<ColorGroup> groups;
    std::unordered_map<sf::Color, size_t> groupByColor;
    std::vector<std::uint32_t> pixelGroup(static_cast<size_t>(width) * static_cast<size_t>(height), 0);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const size_t p = static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x);
            const sf::Color color(pixels[p * 4], pixels[p * 4 + 1], pixels[p * 4 + 2]);
            auto it = groupByColor.find(color);
            if (it == groupByColor.end()) {
                it = groupByColor.emplace(color, groups.size()).first;
                groups.push_back(ColorGroup{color});
            }
            ColorGroup& group = groups[it->second];
            group.box.left = std::min(group.box.left, x);
            group.box.top = std::min(group.box.top, y);
            group.box.right = std::max(group.box.right, x + 1);
            group.box.bottom = std::max(group.box.bottom, y + 1);
            group.pixelCount++;
            pixelGroup[p] = static_cast<std::uint32_t>(it->second);
        }
    }

    // Recognised groups become provinces; the rest are recorded and dropped.
    constexpr size_t kNoProvince = std::numeric_limits<size_t>::max();
    std::vector<size_t> provinceOfGroup(groups.size(), kNoProvince);
    for (size_t g = 0; g < groups.size(); ++g) {
        const ColorGroup& group = groups[g];
        int provinceId = -1;
        if (!colorTable.findProvince(group.color, provinceId)) {
            m_unrecognized.push_back(UnrecognizedColor{group.color, group.pixelCount});
            continue;
        }
        Province province;
        province.id = provinceId;
        province.color = group.color;
        province.boundingBox = group.box;
        province.mask = ProvinceMask(group.box.width(), group.box.height());
        provinceOfGroup[g] = m_provinces.size();
        m_indexById[provinceId] = m_provinces.size();
        m_provinces.push_back(std::move(province));
    }

    // Pass 2: set mask bits.
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const size_t p = static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x);
            const size_t provinceIndex = provinceOfGroup[pixelGroup[p]];
            if (provinceIndex == kNoProvince) continue;
            Province& province = m_provinces[provinceIndex];
            province.mask.set(x - province.boundingBox.left, y - province.boundingBox.top);
        }
    }
}

const Province* ProvinceMap::findProvince(int provinceId) const {
    auto it = m_indexById.find(provinceId);
    return it == m_indexById.end() ? nullptr : &m_provinces[it->second];
}

ProvinceMap ProvinceMap::doubled() const {
    ProvinceMap out;
    const unsigned int width = getWidth();
    const unsigned int height = getHeight();
    out.m_image.create(width * 2, height * 2, sf::Color::Black);
    for (unsigned int y = 0; y < height * 2; ++y) {
        for (unsigned int x = 0; x < width * 2; ++x) {
            out.m_image.setPixel(x, y, m_image.getPixel(x / 2, y / 2));
        }
    }
    out.m_provinces.reserve(m_provinces.size());
    for (const Province& province : m_provinces) {
        Province scaled;
        scaled.id = province.id;
        scaled.color = province.color;
        scaled.boundingBox = PixelBox{province.boundingBox.left * 2,
                                      province.boundingBox.top * 2,
                                      province.boundingBox.right * 2,
                                      province.boundingBox.bottom * 2};
        scaled.mask = province.mask.doubled();
        out.m_provinces.push_back(std::move(scaled));
    }
    out.m_indexById = m_indexById;
    out.m_unrecognized = m_unrecognized;
    return out;
}
