#include "test_helpers.hpp"

#include <cstring>

int main()
{
    std::vector<std::string> strings;
    strings.push_back("ab");
    strings.push_back("");
    const std::vector<unsigned char> out = bchain::encode("cmd", to_parts(strings));

    const unsigned char expected[] = {'c', 'm', 'd', 0x81, 0x02, 'a', 'b', 0x80, 0xff};
    assert(out.size() == sizeof(expected));
    assert(std::memcmp(&out[0], expected, sizeof(expected)) == 0);

    // empty chain is the EOC byte alone
    const std::vector<unsigned char> empty =
      bchain::encode("", std::vector<bchain::part_t>());
    assert(empty.size() == 1);
    assert(empty[0] == 0xff);

    // minimal length width
    const std::vector<unsigned char> big =
      bchain::encode("", std::vector<bchain::part_t>(1, bchain::part_t(256, 'z')));
    assert(big.size() == 1 + 2 + 256 + 1);
    assert(big[0] == 0x82);
    assert(big[1] == 0x01);
    assert(big[2] == 0x00);

    // failures leave the output alone
    std::vector<unsigned char> kept(3, 7);
    assert(bchain::encode("bad\x80", to_parts(strings), kept) == -1);
    assert(bchain::last_error().code() == EBCHAINPREFIX);
    assert(kept.size() == 3);
    assert(kept[0] == 7);

    // round trip through the decoder
    bchain::stream_decoder_t decoder;
    std::vector<bchain::event_t> events;
    assert(decoder.feed(&out[0], out.size(), events) == 4);
    assert(describe(events)
           == "prefix cmd\n"
              "part 0 ab\n"
              "part 1 \n"
              "chain cmd 2 [ab] []\n");
    assert(decoder.finish() == 0);

    return 0;
}
