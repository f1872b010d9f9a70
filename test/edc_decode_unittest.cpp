#include "edc_decode.hpp"
#include "edc_errors.hpp"

#include <gtest/gtest.h>
#include <string>

namespace edc2svd {
namespace {

ErrorKind errorKindOf(auto&& f) {
    try {
        f();
    } catch(ConversionError const& error) {
        return error.kind();
    }
    ADD_FAILURE() << "no ConversionError thrown";
    return ErrorKind::MissingStructure;
}

TEST(ParseAddressLiteralTest, HexAndDecimal) {
    EXPECT_EQ(26U, parseAddressLiteral("0x1A"));
    EXPECT_EQ(26U, parseAddressLiteral("0x1a"));
    EXPECT_EQ(26U, parseAddressLiteral("26"));
    EXPECT_EQ(0U, parseAddressLiteral("0"));
    EXPECT_EQ(0xBF886000U, parseAddressLiteral("0xBF886000"));
    EXPECT_EQ(0xFFFFFFFFU, parseAddressLiteral("4294967295"));
}

TEST(ParseAddressLiteralTest, RejectsMalformedNumbers) {
    for(std::string const text : {"", "0x", "1A", "0X1A", "-1", " 26", "26 ", "0x1G", "4294967296"}) {
        EXPECT_EQ(ErrorKind::MalformedNumber, errorKindOf([&] { parseAddressLiteral(text); }))
          << text;
    }
}

TEST(DecodeResetPatternTest, PlaceholdersResetToZero) {
    EXPECT_EQ(16U, decodeResetPattern("1-0xu"));
    EXPECT_EQ(0U, decodeResetPattern(std::string(32, '-')));
    EXPECT_EQ(0x80000001U, decodeResetPattern("1" + std::string(30, 'x') + "1"));
    EXPECT_EQ(5U, decodeResetPattern("101"));
}

TEST(DecodeResetPatternTest, RejectsNonBinary) {
    EXPECT_EQ(ErrorKind::MalformedNumber, errorKindOf([] { decodeResetPattern(""); }));
    EXPECT_EQ(ErrorKind::MalformedNumber, errorKindOf([] { decodeResetPattern("102"); }));
    EXPECT_EQ(ErrorKind::MalformedNumber, errorKindOf([] { decodeResetPattern("1-0?"); }));
    EXPECT_EQ(ErrorKind::MalformedNumber,
              errorKindOf([] { decodeResetPattern(std::string(33, '1')); }));
}

TEST(DecodePortalsTest, RecognizedForms) {
    auto const all = decodePortals("CLR SET INV");
    EXPECT_TRUE(all.clr);
    EXPECT_TRUE(all.set);
    EXPECT_TRUE(all.inv);

    auto const clearOnly = decodePortals("CLR - -");
    EXPECT_TRUE(clearOnly.clr);
    EXPECT_FALSE(clearOnly.set);
    EXPECT_FALSE(clearOnly.inv);

    auto const none = decodePortals("- - -");
    EXPECT_FALSE(none.clr);
    EXPECT_FALSE(none.set);
    EXPECT_FALSE(none.inv);
}

TEST(DecodePortalsTest, NoSilentDefault) {
    for(std::string const text : {"", "CLR SET -", "- SET -", "clr set inv", "CLR  SET INV"}) {
        EXPECT_EQ(ErrorKind::UnrecognizedPortalsSpec, errorKindOf([&] { decodePortals(text); }))
          << text;
    }
}

TEST(FirstWordTest, KeepsLeadingToken) {
    EXPECT_EQ("UART1", firstWord("UART1 UART2"));
    EXPECT_EQ("SPI", firstWord("SPI\tSPI2"));
    EXPECT_EQ("PORTA", firstWord("PORTA"));
    EXPECT_EQ("", firstWord(" PORTA"));
}

TEST(ConversionErrorTest, MessageNamesKind) {
    try {
        decodePortals("bogus");
        FAIL() << "no ConversionError thrown";
    } catch(ConversionError const& error) {
        EXPECT_EQ(ErrorKind::UnrecognizedPortalsSpec, error.kind());
        EXPECT_NE(std::string{error.what()}.find("UnrecognizedPortalsSpec"), std::string::npos);
        EXPECT_NE(std::string{error.what()}.find("bogus"), std::string::npos);
    }
}

}   // namespace
}   // namespace edc2svd
