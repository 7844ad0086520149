#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <cstdlib>
#include <fstream>

TEST(Config, EmptyDocumentUsesDefaults) {
    auto r = Config::parse("{}");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value.sidecar();
    EXPECT_EQ(c.sbatch_path, "/usr/bin/sbatch");
    EXPECT_EQ(c.scancel_path, "/usr/bin/scancel");
    EXPECT_EQ(c.data_root_folder, ".local/interlink/jobs/");
    EXPECT_EQ(c.bash_path, "/bin/bash");
    EXPECT_EQ(c.container_runtime, "singularity");
    EXPECT_FALSE(c.export_pod_data);
    EXPECT_FALSE(c.verbose_logging);
    EXPECT_EQ(c.singularity.path, "singularity");
    EXPECT_EQ(c.singularity.default_options,
              (std::vector<std::string>{"--nv", "--no-eval", "--containall"}));
    EXPECT_EQ(c.enroot.default_options, std::vector<std::string>{"--rw"});
}

TEST(Config, ParsesAllKeys) {
    auto r = Config::parse(R"(
SbatchPath: /opt/slurm/bin/sbatch
ScancelPath: /opt/slurm/bin/scancel
DataRootFolder: /var/lib/sidecar
Namespace: vk
BashPath: /usr/bin/bash
CommandPrefix: "export X=1"
ImagePrefix: "docker://"
ExportPodData: true
VerboseLogging: true
ErrorsOnlyLogging: false
LogFile: /tmp/sidecar.log
ContainerRuntime: enroot
SingularityPath: /opt/apptainer
SingularityPrefix: "module load apptainer &&"
SingularityDefaultOptions: ["--nv"]
EnrootPath: /opt/enroot
EnrootPrefix: "srun"
EnrootDefaultOptions: "--rw"
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value.sidecar();
    EXPECT_EQ(c.sbatch_path, "/opt/slurm/bin/sbatch");
    EXPECT_EQ(c.scancel_path, "/opt/slurm/bin/scancel");
    EXPECT_EQ(c.data_root_folder, "/var/lib/sidecar/");  // trailing slash added
    EXPECT_EQ(c.ns, "vk");
    EXPECT_EQ(c.bash_path, "/usr/bin/bash");
    EXPECT_EQ(c.command_prefix, "export X=1");
    EXPECT_EQ(c.image_prefix, "docker://");
    EXPECT_TRUE(c.export_pod_data);
    EXPECT_TRUE(c.verbose_logging);
    EXPECT_EQ(c.log_file, "/tmp/sidecar.log");
    EXPECT_EQ(c.container_runtime, "enroot");
    EXPECT_EQ(c.singularity.path, "/opt/apptainer");
    EXPECT_EQ(c.singularity.prefix, "module load apptainer &&");
    EXPECT_EQ(c.singularity.default_options, std::vector<std::string>{"--nv"});
    EXPECT_EQ(c.enroot.path, "/opt/enroot");
    EXPECT_EQ(c.enroot.prefix, "srun");
    EXPECT_EQ(c.enroot.default_options, std::vector<std::string>{"--rw"});
}

TEST(Config, UnknownRuntimeIsNotAConfigError) {
    // Validated per submission, not at load time
    auto r = Config::parse("ContainerRuntime: docker\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.sidecar().container_runtime, "docker");
}

TEST(Config, MalformedYaml) {
    auto r = Config::parse("SbatchPath: [unclosed\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(Config, ExplicitPathWins) {
    EXPECT_EQ(resolve_config_path(fs::path("/tmp/explicit.yaml")), fs::path("/tmp/explicit.yaml"));
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        file = platform::temp_file("sidecar_config");
        std::ofstream(file) << "SbatchPath: /from/file/sbatch\nDataRootFolder: /from/file\n";
    }

    void TearDown() override {
        unsetenv(CONFIG_PATH_ENV);
        unsetenv("SBATCHPATH");
        unsetenv("DATAROOTFOLDER");
        unsetenv("CONTAINERRUNTIME");
        fs::remove(file);
    }
};

TEST_F(ConfigFileTest, LoadFromEnvironmentPath) {
    setenv(CONFIG_PATH_ENV, file.c_str(), 1);
    EXPECT_EQ(resolve_config_path(), file);

    auto r = Config::load();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.sidecar().sbatch_path, "/from/file/sbatch");
    EXPECT_EQ(r.value.source_path(), file);
}

TEST_F(ConfigFileTest, EnvironmentOverrides) {
    setenv("SBATCHPATH", "/env/sbatch", 1);
    setenv("DATAROOTFOLDER", "/env/root", 1);
    setenv("CONTAINERRUNTIME", "enroot", 1);

    auto r = Config::load(file);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.sidecar().sbatch_path, "/env/sbatch");
    EXPECT_EQ(r.value.sidecar().data_root_folder, "/env/root/");
    EXPECT_EQ(r.value.sidecar().container_runtime, "enroot");
}

TEST_F(ConfigFileTest, MissingFile) {
    auto r = Config::load(fs::path(file.string() + ".missing"));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}
