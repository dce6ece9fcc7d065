// Unit tests for the incremental multipart/form-data parser

#include "test_framework.hpp"
#include "test_support.hpp"

#include "http/HttpError.hpp"
#include "http/MultipartParser.hpp"

using namespace lanshare;
using namespace lanshare::http;
using lanshare::test::FormPart;
using lanshare::test::multipartBody;
using lanshare::test::patternBytes;

namespace {

// Mirrors the upload policy: fileId is a field, "file" with a filename is streamed
class RecordingHandler final : public MultipartHandler {
public:
    PartDisposition onPartHeaders(const PartHeaders& headers) override {
        log += "H(" + headers.name + "|" + headers.filename + ")";
        if (headers.name == "fileId") return PartDisposition::Field;
        if (headers.name == "file" && headers.isFile()) {
            filename = headers.filename;
            contentType = headers.content_type;
            return PartDisposition::File;
        }
        return PartDisposition::Skip;
    }

    void onFieldValue(const PartHeaders& headers, const std::string& value) override {
        log += "V(" + headers.name + "=" + value + ")";
        fields.push_back(value);
    }

    void onPartData(const char* data, size_t len) override {
        fileData.append(data, len);
        ++dataEvents;
    }

    void onPartEnd(const PartHeaders& headers) override {
        log += "E(" + headers.name + ")";
        ++ends;
    }

    // Event log without data chunk boundaries, which depend on the split
    std::string summary() const {
        return log + "#" + std::to_string(fileData.size());
    }

    std::string log;
    std::vector<std::string> fields;
    std::string fileData;
    std::string filename;
    std::string contentType;
    int dataEvents = 0;
    int ends = 0;
};

const std::string kBoundary = "----WebKitFormBoundary7MA4YWxkTrZu0gW";

void feedInPieces(MultipartStreamParser& parser, const std::string& body, const std::vector<size_t>& sizes) {
    size_t pos = 0;
    size_t i = 0;
    while (pos < body.size()) {
        size_t n = std::min(body.size() - pos, std::max<size_t>(1, sizes[i++ % sizes.size()]));
        parser.feed(body.data() + pos, n);
        pos += n;
    }
}

std::string standardBody(const std::string& data) {
    return multipartBody(kBoundary, {
        {"fileId", std::nullopt, "abc-123"},
        {"file", std::string("photo.jpg"), data, "image/jpeg"},
    });
}

} // namespace

TEST(parses_field_and_file_in_one_chunk) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string data = "hello\r\nworld";
    std::string body = standardBody(data);

    parser.feed(body.data(), body.size());
    parser.finish();

    ASSERT_TRUE(parser.done());
    ASSERT_EQ(handler.fields.size(), size_t(1));
    ASSERT_EQ(handler.fields[0], std::string("abc-123"));
    ASSERT_EQ(handler.filename, std::string("photo.jpg"));
    ASSERT_EQ(handler.contentType, std::string("image/jpeg"));
    ASSERT_EQ(handler.fileData, data);
    ASSERT_EQ(handler.ends, 1);
}

TEST(every_two_piece_split_gives_same_events) {
    std::string data = patternBytes(300);
    std::string body = standardBody(data);

    RecordingHandler reference;
    {
        MultipartStreamParser parser(kBoundary, reference);
        parser.feed(body.data(), body.size());
        parser.finish();
    }

    for (size_t split = 0; split <= body.size(); ++split) {
        RecordingHandler handler;
        MultipartStreamParser parser(kBoundary, handler);
        parser.feed(body.data(), split);
        parser.feed(body.data() + split, body.size() - split);
        parser.finish();

        if (handler.summary() != reference.summary() || handler.fileData != data) {
            ASSERT_EQ(handler.summary(), reference.summary());
            ASSERT_TRUE(handler.fileData == data);
            break;
        }
    }
}

TEST(byte_at_a_time_feed) {
    std::string data = patternBytes(1000, 3);
    std::string body = standardBody(data);

    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    for (char c : body) {
        parser.feed(&c, 1);
    }
    parser.finish();

    ASSERT_TRUE(handler.fileData == data);
    ASSERT_EQ(handler.fields[0], std::string("abc-123"));
    ASSERT_EQ(handler.ends, 1);
}

TEST(irregular_chunkings_match_contiguous_parse) {
    std::string data = patternBytes(200 * 1024, 11);
    std::string body = standardBody(data);
    const std::vector<std::vector<size_t>> chunkings = {
        {1, 2, 3, 5, 8, 13},
        {kBoundary.size() - 1, kBoundary.size() + 1},
        {4096},
        {65536, 7},
        {kBoundary.size() + 2, 1, 17, 40000},
    };

    for (const auto& sizes : chunkings) {
        RecordingHandler handler;
        MultipartStreamParser parser(kBoundary, handler);
        feedInPieces(parser, body, sizes);
        parser.finish();
        ASSERT_TRUE(handler.fileData == data);
        ASSERT_EQ(handler.log, std::string("H(fileId|)V(fileId=abc-123)H(file|photo.jpg)E(file)"));
    }
}

TEST(retains_bounded_tail_while_streaming) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string head = "--" + kBoundary + "\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"a.bin\"\r\n\r\n";
    parser.feed(head.data(), head.size());

    std::string data = patternBytes(100000, 5);
    parser.feed(data.data(), data.size());

    // Everything but the lookback tail has been flushed
    ASSERT_EQ(parser.buffered(), kBoundary.size() + 2 + 10);
    ASSERT_EQ(handler.fileData.size(), data.size() - parser.buffered());
    ASSERT_EQ(std::string(parser.stateName()), std::string("ReadingFileData"));
}

TEST(file_part_before_file_id) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = multipartBody(kBoundary, {
        {"file", std::string("notes.txt"), "some text", "text/plain"},
        {"fileId", std::nullopt, "late-id"},
    });

    parser.feed(body.data(), body.size());
    parser.finish();

    ASSERT_EQ(handler.log, std::string("H(file|notes.txt)E(file)H(fileId|)V(fileId=late-id)"));
    ASSERT_EQ(handler.fileData, std::string("some text"));
}

TEST(unrecognized_parts_are_skipped) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = multipartBody(kBoundary, {
        {"comment", std::nullopt, "ignore me"},
        {"fileId", std::nullopt, "x1"},
        {"avatar", std::string("other.png"), "not the file"},
        {"file", std::string("keep.bin"), "payload"},
    });

    parser.feed(body.data(), body.size());
    parser.finish();

    ASSERT_EQ(handler.fields.size(), size_t(1));
    ASSERT_EQ(handler.fields[0], std::string("x1"));
    ASSERT_EQ(handler.fileData, std::string("payload"));
    ASSERT_EQ(handler.filename, std::string("keep.bin"));
}

TEST(skipped_part_may_contain_boundary_text_mid_line) {
    std::string tricky = "quote: --" + kBoundary + " is just text\r\nand again x--" + kBoundary + "--";
    std::string body = multipartBody(kBoundary, {
        {"notes", std::nullopt, tricky},
        {"fileId", std::nullopt, "after-notes"},
        {"file", std::string("kept.txt"), "real payload"},
    });

    RecordingHandler whole;
    MultipartStreamParser contiguous(kBoundary, whole);
    contiguous.feed(body.data(), body.size());
    contiguous.finish();

    ASSERT_EQ(whole.fields.size(), size_t(1));
    ASSERT_EQ(whole.fields[0], std::string("after-notes"));
    ASSERT_EQ(whole.fileData, std::string("real payload"));
    ASSERT_EQ(whole.ends, 1);

    RecordingHandler bytewise;
    MultipartStreamParser parser(kBoundary, bytewise);
    feedInPieces(parser, body, {1});
    parser.finish();
    ASSERT_EQ(bytewise.summary(), whole.summary());
}

TEST(truncated_skipped_part_is_incomplete) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = multipartBody(kBoundary, {{"notes", std::nullopt, "long text that never ends"}});
    body.resize(body.size() - kBoundary.size() - 8);

    parser.feed(body.data(), body.size());
    ASSERT_EQ(std::string(parser.stateName()), std::string("SkippingPart"));
    ASSERT_THROWS_AS(parser.finish(), HttpError);
}

TEST(empty_file_part) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = standardBody("");

    parser.feed(body.data(), body.size());
    parser.finish();

    ASSERT_EQ(handler.ends, 1);
    ASSERT_TRUE(handler.fileData.empty());
    ASSERT_EQ(handler.dataEvents, 0);
}

TEST(boundary_like_bytes_inside_data_are_kept) {
    std::string data = "line\n--" + kBoundary + "x not a delimiter\r\n-" + kBoundary;
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = standardBody(data);

    feedInPieces(parser, body, {3});
    parser.finish();

    ASSERT_TRUE(handler.fileData == data);
}

TEST(preamble_and_epilogue_are_ignored) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = "This is the preamble.\r\n" + standardBody("abc") + "epilogue bytes --" + kBoundary;

    parser.feed(body.data(), body.size());
    parser.finish();

    ASSERT_TRUE(parser.done());
    ASSERT_EQ(handler.fileData, std::string("abc"));
    ASSERT_EQ(handler.ends, 1);
}

TEST(truncated_file_data_is_incomplete) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = standardBody(patternBytes(5000));
    parser.feed(body.data(), body.size() / 2);

    ASSERT_EQ(std::string(parser.stateName()), std::string("ReadingFileData"));
    bool incomplete = false;
    try {
        parser.finish();
    } catch (const HttpError& e) {
        incomplete = e.kind() == ErrorKind::IncompleteTransfer;
    }
    ASSERT_TRUE(incomplete);
    ASSERT_EQ(handler.ends, 0);
}

TEST(truncated_headers_are_incomplete) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = "--" + kBoundary + "\r\nContent-Disposition: form-da";
    parser.feed(body.data(), body.size());
    ASSERT_THROWS_AS(parser.finish(), HttpError);
}

TEST(missing_closing_delimiter_after_complete_parts_is_accepted) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler);
    std::string body = standardBody("xyz");
    // Drop the trailing "--\r\n" of the closing delimiter
    body = body.substr(0, body.size() - 4);

    parser.feed(body.data(), body.size());
    parser.finish();

    ASSERT_EQ(handler.fileData, std::string("xyz"));
    ASSERT_EQ(handler.ends, 1);
}

TEST(oversized_header_block_is_malformed) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler, 256, 1024);
    std::string body = "--" + kBoundary + "\r\nX-Filler: " + std::string(1000, 'a');

    bool malformed = false;
    try {
        parser.feed(body.data(), body.size());
    } catch (const HttpError& e) {
        malformed = e.kind() == ErrorKind::MalformedRequest;
    }
    ASSERT_TRUE(malformed);
}

TEST(oversized_field_value_is_malformed) {
    RecordingHandler handler;
    MultipartStreamParser parser(kBoundary, handler, 1024, 64);
    std::string body = multipartBody(kBoundary, {{"fileId", std::nullopt, std::string(500, 'z')}});
    ASSERT_THROWS_AS(parser.feed(body.data(), body.size()), HttpError);
}

TEST(empty_boundary_is_rejected) {
    RecordingHandler handler;
    ASSERT_THROWS_AS(MultipartStreamParser("", handler), HttpError);
}

TEST(extract_boundary_variants) {
    ASSERT_EQ(MultipartStreamParser::extractBoundary("multipart/form-data; boundary=abc123"),
              std::string("abc123"));
    ASSERT_EQ(MultipartStreamParser::extractBoundary("multipart/form-data; charset=utf-8; BOUNDARY=\"q u o\""),
              std::string("q u o"));
    ASSERT_EQ(MultipartStreamParser::extractBoundary("multipart/form-data"), std::string(""));
    ASSERT_EQ(MultipartStreamParser::extractBoundary("multipart/form-data; charset=utf-8"), std::string(""));
}

TEST(content_disposition_with_quoted_separators) {
    std::string name, filename;
    MultipartStreamParser::parseContentDisposition(
        "form-data; name=\"file\"; filename=\"a;b \\\"c\\\".txt\"", name, filename);
    ASSERT_EQ(name, std::string("file"));
    ASSERT_EQ(filename, std::string("a;b \"c\".txt"));
}

TEST(header_block_parsing) {
    PartHeaders headers = MultipartStreamParser::parseHeaderBlock(
        "content-disposition: form-data; name=\"file\"; filename=\"x.png\"\r\nContent-Type:  image/png ");
    ASSERT_EQ(headers.name, std::string("file"));
    ASSERT_EQ(headers.filename, std::string("x.png"));
    ASSERT_EQ(headers.content_type, std::string("image/png"));
    ASSERT_TRUE(headers.isFile());
}

RUN_TESTS()
