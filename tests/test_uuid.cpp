// tests/test_uuid.cpp
#include <gtest/gtest.h>
#include <string>

#include "gatt/uuid.hpp"

namespace
{
std::string norm(const std::string &s)
{
    std::string out;
    webble::Status st = gatt::normalize_uuid(s, out);
    EXPECT_TRUE(st.ok()) << st.to_string();
    return out;
}
}  // namespace

TEST(Uuid, ShortFormsExpandOnBaseUuid)
{
    EXPECT_EQ(norm("180d"), "0000180d-0000-1000-8000-00805f9b34fb");
    EXPECT_EQ(norm("0x180D"), "0000180d-0000-1000-8000-00805f9b34fb");
    EXPECT_EQ(norm("0000180D"), "0000180d-0000-1000-8000-00805f9b34fb");
    EXPECT_EQ(norm("0X12345678"), "12345678-0000-1000-8000-00805f9b34fb");
}

TEST(Uuid, LongFormsAreLowercasedAndDashed)
{
    const std::string want = "6e400001-b5a3-f393-e0a9-e50e24dcca9e";
    EXPECT_EQ(norm("6E400001-B5A3-F393-E0A9-E50E24DCCA9E"), want);
    EXPECT_EQ(norm("6e400001b5a3f393e0a9e50e24dcca9e"), want);
    EXPECT_EQ(norm("{6e400001-b5a3-f393-e0a9-e50e24dcca9e}"), want);
    EXPECT_EQ(norm("  6e400001-b5a3-f393-e0a9-e50e24dcca9e \t"), want);
}

TEST(Uuid, NormalizationIsIdempotent)
{
    for (const char *tok : {"180d", "0x2A37", "6E400001B5A3F393E0A9E50E24DCCA9E"})
    {
        const std::string once = norm(tok);
        EXPECT_EQ(norm(once), once) << tok;
    }
}

TEST(Uuid, RejectsMalformedTokens)
{
    for (const char *tok : {"", "18d", "0x18d", "xyz1", "180d0", "0x123456789",
                            "6e400001-b5a3-f393-e0a9-e50e24dcca9",
                            "6e400001_b5a3_f393_e0a9_e50e24dcca9e",
                            "6e400001-b5a3-f393-e0a9-e50e24dcca9g", "{180d}"})
    {
        std::string    out = "untouched";
        webble::Status st  = gatt::normalize_uuid(tok, out);
        EXPECT_EQ(st.kind(), webble::ErrorKind::InvalidUuid) << "'" << tok << "'";
    }
}

TEST(Uuid, InvalidUuidMessageNamesToken)
{
    std::string    out;
    webble::Status st = gatt::normalize_uuid("not-a-uuid", out);
    ASSERT_FALSE(st.ok());
    EXPECT_NE(st.message().find("not-a-uuid"), std::string::npos);
}

TEST(Uuid, EqualityAcrossForms)
{
    EXPECT_TRUE(gatt::uuid_eq("2a37", "00002A37-0000-1000-8000-00805F9B34FB"));
    EXPECT_TRUE(gatt::uuid_eq("0x2a37", "00002a37"));
    EXPECT_FALSE(gatt::uuid_eq("2a37", "2a38"));
    EXPECT_FALSE(gatt::uuid_eq("bogus", "bogus"));
}
