#include <tkn/Error.hpp>

#include <iomanip>

namespace tkn {

    std::ostream &operator<<(std::ostream &os, const ScanError &error)
    {
        os << error.pos << ": error: invalid character '";

        const auto uch = static_cast<unsigned char>(error.ch);
        if (uch >= 0x20 && uch < 0x7f)
            os << error.ch;
        else
        {
            const auto flags = os.flags();
            const auto fill = os.fill('0');
            os << "\\x" << std::hex << std::setw(2) << static_cast<unsigned int>(uch);
            os.fill(fill);
            os.flags(flags);
        }

        return os << "'";
    }

} // namespace tkn
