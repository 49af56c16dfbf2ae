#ifndef MD5_HPP
#define MD5_HPP

#include <string>


// Lowercase hexadecimal MD5 digest, as the server expects in login hashes
std::string md5Hex(std::string const & data);


#endif
