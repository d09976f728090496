#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "flycache/cache/remote/RespCodec.hpp"

using namespace flycache::cache::remote;

void testEncode() {
    assert(encodeCommand({"GET", "k"}) == "*2\r\n$3\r\nGET\r\n$1\r\nk\r\n");
    assert(encodeCommand({"SET", "k", ""}) == "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$0\r\n\r\n");
    std::cout << "[OK] RESP command encoding\n";
}

void testReplyKinds() {
    RespReader reader;
    reader.feed("+OK\r\n-ERR boom\r\n:42\r\n$5\r\nhello\r\n$-1\r\n*-1\r\n*2\r\n$1\r\na\r\n:7\r\n$0\r\n\r\n");

    auto simple = reader.next();
    assert(simple && simple->type == RespValue::Type::SimpleString && simple->str == "OK");
    auto error = reader.next();
    assert(error && error->isError() && error->str == "ERR boom");
    auto integer = reader.next();
    assert(integer && integer->type == RespValue::Type::Integer && integer->integer == 42);
    auto bulk = reader.next();
    assert(bulk && bulk->type == RespValue::Type::BulkString && bulk->str == "hello");
    auto nullBulk = reader.next();
    assert(nullBulk && nullBulk->isNull());
    auto nullArray = reader.next();
    assert(nullArray && nullArray->isNull());
    auto array = reader.next();
    assert(array && array->type == RespValue::Type::Array && array->elements.size() == 2);
    assert(array->elements[0].str == "a" && array->elements[1].integer == 7);
    auto empty = reader.next();
    assert(empty && empty->type == RespValue::Type::BulkString && empty->str.empty());
    assert(!reader.next());
    assert(reader.buffered() == 0);
    std::cout << "[OK] RESP reply kinds\n";
}

void testPartialInput() {
    RespReader reader;
    const std::string reply = "*2\r\n$1\r\n0\r\n*2\r\n$6\r\nuser:1\r\n$9\r\nbin\r\nary!\r\n";
    for (size_t i = 0; i + 1 < reply.size(); ++i) {
        reader.feed(&reply[i], 1);
        assert(!reader.next());
    }
    reader.feed(&reply.back(), 1);
    auto value = reader.next();
    assert(value && value->elements.size() == 2);
    assert(value->elements[1].elements[1].str == "bin\r\nary!");
    std::cout << "[OK] RESP partial input\n";
}

void testProtocolErrors() {
    bool thrown = false;
    try {
        RespReader reader;
        reader.feed("!oops\r\n");
        reader.next();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        RespReader reader;
        reader.feed("$3\r\nabcXY");
        reader.next();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] RESP protocol errors\n";
}

int main() {
    testEncode();
    testReplyKinds();
    testPartialInput();
    testProtocolErrors();
    std::cout << "All RESP codec tests passed!\n";
    return 0;
}
