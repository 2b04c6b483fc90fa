#include <catch2/catch.hpp>

#include "core/SegmentAssembler.hpp"
#include "core/DownloadError.hpp"
#include "util/file.hpp"
#include "TestHelpers.hpp"

TEST_CASE("SegmentAssembler concatenates parts in order", "[merge]")
{
    TempDir dir;
    writeFile(dir.file("a.1.part"), "first-");
    writeFile(dir.file("a.2.part"), "second-");
    writeFile(dir.file("a.3.part"), "third");

    SegmentAssembler assembler(dir.file("a"));
    assembler.assemble({dir.file("a.1.part"), dir.file("a.2.part"), dir.file("a.3.part")});

    CHECK(readFile(dir.file("a")) == "first-second-third");
    CHECK_FALSE(fileExists(dir.file("a.1.part")));
    CHECK_FALSE(fileExists(dir.file("a.3.part")));
    CHECK_FALSE(fileExists(assembler.getTemporaryPath()));
}

TEST_CASE("SegmentAssembler never exposes a partial artifact", "[merge]")
{
    TempDir dir;
    writeFile(dir.file("a.1.part"), "first-");
    writeFile(dir.file("a.3.part"), "third");

    SegmentAssembler assembler(dir.file("a"));

    SECTION("No artifact existed")
    {
        CHECK_THROWS_AS(assembler.assemble({dir.file("a.1.part"), dir.file("a.2.part"), dir.file("a.3.part")}),
                        DownloadError);
        CHECK_FALSE(fileExists(dir.file("a")));
    }

    SECTION("An older artifact stays untouched")
    {
        writeFile(dir.file("a"), "previous");
        CHECK_THROWS_AS(assembler.assemble({dir.file("a.1.part"), dir.file("a.2.part"), dir.file("a.3.part")}),
                        DownloadError);
        CHECK(readFile(dir.file("a")) == "previous");
    }

    CHECK_FALSE(fileExists(assembler.getTemporaryPath()));
    CHECK(fileExists(dir.file("a.1.part")));
    CHECK(fileExists(dir.file("a.3.part")));
}

TEST_CASE("SegmentAssembler reports merge failures by kind", "[merge]")
{
    TempDir dir;
    SegmentAssembler assembler(dir.file("a"));

    try
    {
        assembler.assemble({dir.file("missing.part")});
        FAIL("assemble did not throw");
    }
    catch (const DownloadError &e)
    {
        CHECK(e.getKind() == ErrorKind::MERGE);
    }
}
