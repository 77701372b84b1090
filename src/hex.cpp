#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "hex.hpp"

using namespace std;

namespace nrelay
{
namespace encoding
{
static int _hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
};

bool isHex(const string& value, size_t length, bool lowercaseOnly)
{
    if (value.length() != length)
    {
        return false;
    }

    return all_of(value.begin(), value.end(), [lowercaseOnly](char c)
    {
        if (lowercaseOnly && c >= 'A' && c <= 'F')
        {
            return false;
        }
        return _hexValue(c) >= 0;
    });
};

string toHex(const uint8_t* data, size_t length)
{
    stringstream ss;
    for (size_t i = 0; i < length; i++)
    {
        ss << hex << setw(2) << setfill('0') << static_cast<int>(data[i]);
    }

    return ss.str();
};

string toHex(const vector<uint8_t>& data)
{
    return toHex(data.data(), data.size());
};

vector<uint8_t> fromHex(const string& value)
{
    if (value.length() % 2 != 0)
    {
        throw invalid_argument("fromHex: The hex string must have an even length.");
    }

    vector<uint8_t> bytes;
    bytes.reserve(value.length() / 2);
    for (size_t i = 0; i < value.length(); i += 2)
    {
        int high = _hexValue(value[i]);
        int low = _hexValue(value[i + 1]);
        if (high < 0 || low < 0)
        {
            throw invalid_argument("fromHex: The string contains a non-hex character.");
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return bytes;
};

string toLower(string value)
{
    transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
    {
        return static_cast<char>(tolower(c));
    });

    return value;
};
} // namespace encoding
} // namespace nrelay
