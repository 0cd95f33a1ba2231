#include "preview/text.hpp"

#include <stdexcept>

namespace fk::preview::text {

std::string excerpt(std::istream& in, const size_t max_bytes) {
    std::string buf(max_bytes, '\0');
    in.read(buf.data(), static_cast<std::streamsize>(max_bytes));
    if (in.bad()) throw std::runtime_error("Read error while building text excerpt");
    buf.resize(static_cast<size_t>(in.gcount()));

    // Walk back over continuation bytes to the lead byte of the last sequence.
    size_t i = buf.size();
    size_t cont = 0;
    while (i > 0 && cont < 4 && (static_cast<unsigned char>(buf[i - 1]) & 0xC0) == 0x80) {
        --i;
        ++cont;
    }
    if (i > 0) {
        const auto lead = static_cast<unsigned char>(buf[i - 1]);
        size_t need = 0;
        if ((lead & 0xE0) == 0xC0) need = 1;
        else if ((lead & 0xF0) == 0xE0) need = 2;
        else if ((lead & 0xF8) == 0xF0) need = 3;
        if (need > cont) buf.resize(i - 1);
    }

    return buf;
}

}
