#include <pre/Preprocessor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace {

    std::filesystem::path make_dir(const std::string &name)
    {
        const auto dir = std::filesystem::temp_directory_path() / "spindle_tests" / name;
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    void write(const std::filesystem::path &fp, const std::string &content)
    {
        std::ofstream fo{fp};
        fo << content;
    }

} // namespace

TEST_CASE("trim", "[ut][pre]")
{
    REQUIRE(pre::trim("  a b \t\r\n") == "a b");
    REQUIRE(pre::trim(" \t ").empty());
}

TEST_CASE("replace_all", "[ut][pre]")
{
    std::string str = "N + N*N";
    pre::replace_all(str, "N", "NN");
    REQUIRE(str == "NN + NN*NN");

    pre::replace_all(str, "", "x");
    REQUIRE(str == "NN + NN*NN");
}

TEST_CASE("define", "[ut][pre][Preprocessor]")
{
    pre::Preprocessor pp;
    std::string output;

    SECTION("substitutes in later lines only")
    {
        REQUIRE(pp.process(output, "N;\n#define N 42\nx = N + N;") == ReturnCode::Ok);
        REQUIRE(output == "N;\nx = 42 + 42;\n");
    }
    SECTION("value keeps its spaces")
    {
        REQUIRE(pp.process(output, "  #define SUM a + b\nSUM;\n") == ReturnCode::Ok);
        REQUIRE(output == "a + b;\n");
    }
    SECTION("redefinition replaces the value")
    {
        REQUIRE(pp.process(output, "#define X 1\nX;\n#define X 2\nX;") == ReturnCode::Ok);
        REQUIRE(output == "1;\n2;\n");
    }
    SECTION("define without value is dropped")
    {
        REQUIRE(pp.process(output, "#define EMPTY\nEMPTY;") == ReturnCode::Ok);
        REQUIRE(output == "EMPTY;\n");
    }
    SECTION("carriage returns are stripped")
    {
        REQUIRE(pp.process(output, "a;\r\nb;\r\n") == ReturnCode::Ok);
        REQUIRE(output == "a;\nb;\n");
    }
}

TEST_CASE("include", "[ut][pre][Preprocessor]")
{
    const auto dir = make_dir("include");
    std::filesystem::create_directories(dir / "lib");
    write(dir / "lib" / "util.sp", "#define ONE 1\nfn one() { ONE; }\n");
    write(dir / "main.sp", "#define ONE 100\n#include \"lib/util.sp\"\nx = ONE;\n");

    pre::Preprocessor pp;
    std::string output;

    SECTION("included file has its own macros")
    {
        std::string content;
        {
            std::ifstream fi{dir / "main.sp"};
            content.assign(std::istreambuf_iterator<char>{fi}, {});
        }
        REQUIRE(pp.process(output, content, dir / "main.sp") == ReturnCode::Ok);
        REQUIRE(output == "fn one() { 1; }\n\nx = 100;\n");
    }
    SECTION("missing include is skipped")
    {
        REQUIRE(pp.process(output, "#include \"nope.sp\"\na;", dir / "main.sp") == ReturnCode::Ok);
        REQUIRE(output == "a;\n");
    }
    SECTION("unquoted include is skipped")
    {
        REQUIRE(pp.process(output, "#include lib/util.sp\na;", dir / "main.sp") == ReturnCode::Ok);
        REQUIRE(output == "a;\n");
    }
    SECTION("recursive include is bounded")
    {
        write(dir / "self.sp", "#include \"self.sp\"\n");
        REQUIRE(pp.process(output, "#include \"self.sp\"\n", dir / "main.sp") != ReturnCode::Ok);
    }
}
