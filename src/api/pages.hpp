#ifndef API_PAGES_HPP
#define API_PAGES_HPP

#include <string>


// Markup handed to browsers. The pairing page shows `pairingPrefix + token` as a QR code and
// polls /check-session until the daemon host confirms it.
namespace pages {
    extern char const * const pairingPrefix;

    std::string pairing(std::string const & token);
    std::string app(std::string const & localDevice);
}


#endif
