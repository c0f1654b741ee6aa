/**
 * @file main.cpp
 * @brief Frame inspection tool for the lanlight wire codec.
 *
 * Builds a frame from field values and prints its bytes, or decodes a hex
 * dump (e.g. copied from a packet capture) back into fields.
 *
 * @code
 *   # GetPower to one bulb, sequence 7, response requested
 *   ./lanlight-frame-tool encode --type 20 --seq 7 --source 0x1234 \
 *       --target d0:73:d5:01:02:03 --res
 *
 *   # decode what came off the wire (spaces allowed)
 *   ./lanlight-frame-tool decode --hex "24 00 00 14 34 12 00 00 ..."
 *
 *   # accept unknown message types
 *   ./lanlight-frame-tool decode --hex 2600001434120000... --lenient
 * @endcode
 *
 * Exit status: 0 ok, 1 the input did not encode/decode, 2 usage error.
 */

#include <cstdio>
#include <iostream>
#include <string>
#include "CLI/CLI.hpp"
#include "lanlight/codec.hpp"

using namespace lanlight;

static void print_frame(const Frame& f) {
    const FrameHeader& h = f.header;
    std::cout << "Size:        " << h.size << "\n"
              << "Protocol:    " << h.protocol << "\n"
              << "Tagged:      " << (h.tagged ? "true" : "false") << "\n"
              << "Addressable: " << (h.addressable ? "true" : "false") << "\n"
              << "Source:      0x" << std::hex << h.source << std::dec << "\n"
              << "Target:      " << h.target.to_string() << "\n"
              << "Ack req:     " << (h.ack_required ? "true" : "false") << "\n"
              << "Res req:     " << (h.res_required ? "true" : "false") << "\n"
              << "Sequence:    " << static_cast<int>(h.sequence) << "\n"
              << "Type:        " << h.type << " (" << to_string(f.type()) << ")\n"
              << "Payload:     " << (f.payload.empty() ? "-" : to_hex(f.payload)) << "\n";
}

int main(int argc, char** argv) {

    CLI::App app{"lanlight frame encoder/decoder"};
    app.require_subcommand(1);

    // Subcommand: encode
    uint16_t type = 0;
    int seq = 0;
    uint32_t source = 0;
    std::string target_text, payload_hex;
    bool want_ack = false, want_res = false;
    auto cmd_encode = app.add_subcommand("encode", "Build a frame from fields");
    cmd_encode->add_option("--type", type, "Message type number")->required();
    cmd_encode->add_option("--seq", seq, "Sequence number")->check(CLI::Range(0, 255));
    cmd_encode->add_option("--source", source, "Source id");
    cmd_encode->add_option("--target", target_text, "Hardware id (empty = broadcast)");
    cmd_encode->add_option("--payload", payload_hex, "Payload bytes as hex");
    cmd_encode->add_flag("--ack", want_ack, "Acknowledgement required");
    cmd_encode->add_flag("--res", want_res, "Response required");

    // Subcommand: decode
    std::string frame_hex;
    bool lenient = false;
    auto cmd_decode = app.add_subcommand("decode", "Decode a hex frame");
    cmd_decode->add_option("--hex", frame_hex, "Whole datagram as hex")->required();
    cmd_decode->add_flag("--lenient", lenient, "Keep unknown message types");

    CLI11_PARSE(app, argc, argv);

    if (*cmd_encode) {
        HardwareId target;
        if (!target_text.empty() && !HardwareId::parse(target_text, target)) {
            std::cerr << "error=bad_target value=" << target_text << "\n";
            return 2;
        }
        std::vector<uint8_t> payload;
        if (!from_hex(payload_hex, payload)) {
            std::cerr << "error=bad_hex field=payload\n";
            return 2;
        }

        Frame f = make_frame(source, target, static_cast<uint8_t>(seq), MessageType::GetService, payload);
        f.header.type         = type;
        f.header.ack_required = want_ack;
        f.header.res_required = want_res;

        const auto raw = encode(f);
        Frame check;
        const Status st = decode(raw, check);
        std::cout << to_hex(raw) << "\n";
        if (st != Status::Ok) {
            std::cerr << "warning=does_not_decode reason=" << to_string(st) << "\n";
            return 1;
        }
        return 0;
    }

    if (*cmd_decode) {
        std::vector<uint8_t> raw;
        if (!from_hex(frame_hex, raw)) {
            std::cerr << "error=bad_hex field=hex\n";
            return 2;
        }
        Frame f;
        const Status st = decode(raw, f, !lenient);
        if (st != Status::Ok) {
            std::cerr << "error=decode_failed reason=" << to_string(st) << " len=" << raw.size() << "\n";
            return 1;
        }
        print_frame(f);
        return 0;
    }

    return 2;
}
