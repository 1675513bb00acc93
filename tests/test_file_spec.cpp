#include <gtest/gtest.h>
#include <transfer/file_spec.hpp>

static FileSpec spec(const std::string& lfn, const std::string& turl = "root://host//data/f") {
    FileSpec f;
    f.lfn = lfn;
    f.turl = turl;
    return f;
}

TEST(FileSpec, DirectAccessForPlainRootFiles) {
    EXPECT_TRUE(spec("AOD.01234._000001.pool.root.1").is_directaccess());
    EXPECT_TRUE(spec("AOD.root", "https://host/data/AOD.root").is_directaccess());
    EXPECT_TRUE(spec("AOD.root", "dcap://host/pnfs/AOD.root").is_directaccess());
}

TEST(FileSpec, ArchivesAreNeverDirect) {
    EXPECT_FALSE(spec("lib.tar").is_directaccess(false));
    EXPECT_FALSE(spec("user.job.lib.tgz").is_directaccess(false));
    EXPECT_FALSE(spec("bundle.tar.gz").is_directaccess(false));
    EXPECT_FALSE(spec("data18.00348885.physics.RAW.daq").is_directaccess(false));
    EXPECT_FALSE(spec("cond.dat.1").is_directaccess(false));
    EXPECT_FALSE(spec("input.tgz").is_directaccess(false));
}

TEST(FileSpec, CopyModeOptsOut) {
    auto f = spec("AOD.root");
    f.accessmode = "copy";
    EXPECT_FALSE(f.is_directaccess(false));
    f.accessmode = "direct";
    EXPECT_TRUE(f.is_directaccess(false));
}

TEST(FileSpec, ReplicaSchemeChecked) {
    auto f = spec("AOD.root", "srm://host:8443/srm/managerv2?SFN=/data/AOD.root");
    EXPECT_FALSE(f.is_directaccess(true));
    EXPECT_TRUE(f.is_directaccess(false));

    f.turl = "";
    EXPECT_FALSE(f.is_directaccess(true));
}

TEST(FileSpec, ExpectedChecksum) {
    FileSpec f;
    f.checksum["adler32"] = "001a2b3c";
    f.checksum["md5"] = "";
    EXPECT_EQ(*f.expected_checksum("adler32"), "001a2b3c");
    EXPECT_FALSE(f.expected_checksum("md5").has_value());
    EXPECT_FALSE(f.expected_checksum("sha1").has_value());
}

TEST(FileSpec, StatusNames) {
    EXPECT_STREQ(file_status_name(FileStatus::PENDING), "pending");
    EXPECT_STREQ(file_status_name(FileStatus::REMOTE_IO), "remote_io");
    EXPECT_STREQ(file_status_name(FileStatus::TRANSFERRED), "transferred");
    EXPECT_STREQ(file_status_name(FileStatus::FAILED), "failed");
}
