#include <catch2/catch.hpp>

#include "fold.hpp"

#include <string>

TEST_CASE("to_lower on ASCII", "[fold]") {
  CHECK(to_lower("lInE") == "line");
  CHECK(to_lower("ABC xyz 123 !?") == "abc xyz 123 !?");
  CHECK(to_lower("") == "");
  CHECK(to_lower("@[`{") == "@[`{");
}

TEST_CASE("to_lower folds letters outside ASCII", "[fold]") {
  CHECK(to_lower("\xc3\x84PFEL") == "\xc3\xa4pfel");                  // ÄPFEL -> äpfel
  CHECK(to_lower("\xc3\x89T\xc3\x89") == "\xc3\xa9t\xc3\xa9");        // ÉTÉ -> été
  CHECK(to_lower("\xc3\x9c" "BER") == "\xc3\xbc" "ber");              // ÜBER -> über
  CHECK(to_lower("\xce\xa3\xce\x9f\xce\xa6\xce\x8a\xce\x91") ==       // ΣΟΦΊΑ
        "\xcf\x83\xce\xbf\xcf\x86\xce\xaf\xce\xb1");                  // σοφία
  CHECK(to_lower("\xd0\x9c\xd0\x98\xd0\xa0") ==                       // МИР
        "\xd0\xbc\xd0\xb8\xd1\x80");                                  // мир
}

TEST_CASE("to_lower keeps text without case", "[fold]") {
  CHECK(to_lower("\xe2\x82\xac 42") == "\xe2\x82\xac 42");            // € 42
  CHECK(to_lower("\xe6\x97\xa5\xe6\x9c\xac") == "\xe6\x97\xa5\xe6\x9c\xac");
  CHECK(to_lower(std::string("A\0B", 3)) == std::string("a\0b", 3));
}

TEST_CASE("to_lower copies malformed bytes", "[fold]") {
  CHECK(to_lower("A\xff" "B") == "a\xff" "b");
  CHECK(to_lower("caf\xe9 X") == "caf\xe9 x");
  CHECK(to_lower("\xc3") == "\xc3");
}
