#include <gtest/gtest.h>
#include <managers/mpy_compiler.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

TEST(MpyFormatTest, HeaderCarriesVersionAndSize) {
    std::vector<uint8_t> data{0x4D, 0x05, 0x02, 0x1F};
    std::string out = format_c_array(data);
    EXPECT_EQ(out,
              "// MPY file. Version: 5. Size: 4\n"
              "const uint8_t script[] = {\n"
              "    0x4D, 0x05, 0x02, 0x1F,\n"
              "};\n");
}

TEST(MpyFormatTest, EightBytesPerRow) {
    std::vector<uint8_t> data(10, 0xAB);
    std::string out = format_c_array(data);
    EXPECT_NE(out.find("    0xAB, 0xAB, 0xAB, 0xAB, 0xAB, 0xAB, 0xAB, 0xAB,\n    0xAB, 0xAB,\n"),
              std::string::npos);
    EXPECT_NE(out.find("Size: 10"), std::string::npos);
}

TEST(MpyFormatTest, EmptyData) {
    EXPECT_EQ(format_c_array({}),
              "// MPY file. Version: 0. Size: 0\nconst uint8_t script[] = {\n};\n");
}

class MpyCompilerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    CompileConfig config;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "brickdev_mpy_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        config.build_dir = (test_dir / "build").string();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(MpyCompilerTest, TempScriptGoesToBuildDir) {
    MpyCompiler compiler(config);
    auto py = compiler.write_temp_script("print('hi')");
    ASSERT_TRUE(py.is_ok()) << py.error;
    EXPECT_EQ(py.value.string(), (test_dir / "build" / "_tmp.py").string());

    std::ifstream in(py.value);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "print('hi')\n");
}

TEST_F(MpyCompilerTest, BuildPathThatIsAFileIsAnError) {
    std::ofstream(test_dir / "build") << "not a dir";
    MpyCompiler compiler(config);
    auto r = compiler.ensure_build_dir();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Compile);
}

TEST_F(MpyCompilerTest, MissingScriptIsAnError) {
    MpyCompiler compiler(config);
    auto r = compiler.compile_file(test_dir / "absent.py");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Compile);
}

TEST_F(MpyCompilerTest, MissingToolIsAnError) {
    config.mpy_cross = "brickdev-no-such-mpy-cross";
    std::ofstream(test_dir / "x.py") << "print(1)\n";
    MpyCompiler compiler(config);
    auto r = compiler.compile_file(test_dir / "x.py");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Compile);
}
