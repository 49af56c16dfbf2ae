#include <catch2/catch.hpp>

#include "client/md5.hpp"


TEST_CASE("MD5 digests are lowercase hex", "[md5]") {
    CHECK(md5Hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    CHECK(md5Hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
    CHECK(md5Hex("The quick brown fox jumps over the lazy dog") == "9e107d9d372bb6826bd81d3542a419d6");
}

TEST_CASE("Password logins hash the password twice", "[md5]") {
    CHECK(md5Hex("pw") == "8fe4c11451281c094a6578e6ddbf5eed");
    CHECK(md5Hex(md5Hex("pw") + "T1") == "65956bedf554245a32335e0942da3799");
}
