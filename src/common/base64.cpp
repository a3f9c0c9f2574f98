#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <cctype>
#include <stdexcept>

namespace runner {
using namespace std;
namespace it = boost::archive::iterators;

using base64_encoder = it::base64_from_binary<it::transform_width<string::const_iterator, 6, 8>>;
using base64_decoder = it::transform_width<it::binary_from_base64<string::const_iterator>, 8, 6>;

static bool is_base64_char(unsigned char c) {
    return isalnum(c) || c == '+' || c == '/';
}

string base64_encode(const string &data) {
    string out(base64_encoder(data.begin()), base64_encoder(data.end()));
    out.append((3 - data.size() % 3) % 3, '=');
    return out;
}

string base64_decode(const string &text) {
    string compact;
    compact.reserve(text.size());
    for (unsigned char c : text)
        if (!isspace(c)) compact.push_back(c);

    if (compact.size() % 4 != 0)
        throw invalid_argument("base64 input length is not a multiple of 4");

    size_t padding = 0;
    while (padding < compact.size() && padding < 2 && compact[compact.size() - 1 - padding] == '=')
        ++padding;

    for (size_t i = 0; i < compact.size() - padding; ++i)
        if (!is_base64_char(compact[i]))
            throw invalid_argument("invalid base64 character at offset " + to_string(i));

    // binary_from_base64 不认识 '='，用 'A'（值为 0）代替后再截掉多出来的字节
    compact.replace(compact.size() - padding, padding, padding, 'A');
    string out(base64_decoder(compact.begin()), base64_decoder(compact.end()));
    out.resize(out.size() - padding);
    return out;
}

}  // namespace runner
