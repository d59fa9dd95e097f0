#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "file-helpers.h"

TEST(ConfigurationTest,Lists)
{
	Configuration Cnf;

	Cnf.Set("Repo::Architectures::", "all");
	Cnf.Set("Repo::Architectures::", "arm");
	Cnf.Set("Repo::Architectures::2", "aarch64");
	Cnf.Set("Repo::Architectures::", "x86_64");
	std::vector<std::string> archs = Cnf.FindVector("Repo::Architectures");
	ASSERT_EQ(4u, archs.size());
	EXPECT_EQ("all", archs[0]);
	EXPECT_EQ("arm", archs[1]);
	EXPECT_EQ("aarch64", archs[2]);
	EXPECT_EQ("x86_64", archs[3]);

	EXPECT_TRUE(Cnf.Exists("Repo::Architectures::2"));
	EXPECT_EQ("aarch64", Cnf.Find("Repo::Architectures::2"));
	EXPECT_FALSE(Cnf.Exists("Repo::Architectures::3"));
	EXPECT_EQ("", Cnf.Find("Repo::Architectures::3"));
	EXPECT_EQ("not-set", Cnf.Find("Repo::Architectures::3", "not-set"));

	Cnf.Clear("Repo::Architectures::2");
	archs = Cnf.FindVector("Repo::Architectures");
	ASSERT_EQ(3u, archs.size());
	EXPECT_EQ("x86_64", archs[2]);

	Cnf.Clear("Repo::Architectures");
	EXPECT_TRUE(Cnf.FindVector("Repo::Architectures").empty());
	EXPECT_FALSE(Cnf.Exists("Repo::Architectures"));
}
TEST(ConfigurationTest,Integers)
{
	Configuration Cnf;

	Cnf.CndSet("Repo::Contents::Width", 42);
	Cnf.CndSet("Repo::Contents::Width", "66");
	EXPECT_EQ("42", Cnf.Find("Repo::Contents::Width"));
	EXPECT_EQ(42, Cnf.FindI("Repo::Contents::Width"));
	EXPECT_EQ(42, Cnf.FindI("Repo::Contents::Width", 33));
	EXPECT_EQ(33, Cnf.FindI("Repo::Contents::Depth", 33));

	Cnf.Set("Repo::Contents::Width", "wide");
	EXPECT_EQ(80, Cnf.FindI("Repo::Contents::Width", 80));
	Cnf.Set("Repo::Contents::Width", "0x10");
	EXPECT_EQ(16, Cnf.FindI("Repo::Contents::Width", 80));
}
TEST(ConfigurationTest,Booleans)
{
	Configuration Cnf;

	EXPECT_FALSE(Cnf.FindB("Repo::Sign"));
	EXPECT_TRUE(Cnf.FindB("Repo::Sign", true));
	for (auto const yes : {"yes", "true", "on", "1", "enable", "TRUE"})
	{
	   Cnf.Set("Repo::Sign", yes);
	   EXPECT_TRUE(Cnf.FindB("Repo::Sign")) << yes;
	}
	for (auto const no : {"no", "false", "off", "0", "disable"})
	{
	   Cnf.Set("Repo::Sign", no);
	   EXPECT_FALSE(Cnf.FindB("Repo::Sign", true)) << no;
	}
	Cnf.Set("Repo::Sign", "maybe");
	EXPECT_TRUE(Cnf.FindB("Repo::Sign", true));
	EXPECT_FALSE(Cnf.FindB("Repo::Sign", false));
}
TEST(ConfigurationTest,CaseInsensitive)
{
	Configuration Cnf;
	Cnf.Set("Repo::Distribution", "stable");
	EXPECT_EQ("stable", Cnf.Find("repo::distribution"));
	EXPECT_TRUE(Cnf.Exists("REPO::DISTRIBUTION"));
}
TEST(ConfigurationTest,VectorDefaults)
{
	Configuration Cnf;

	EXPECT_TRUE(Cnf.FindVector("Repo::Architectures").empty());
	EXPECT_EQ(std::vector<std::string>({"arm"}), Cnf.FindVector("Repo::Architectures", "arm"));
	EXPECT_EQ(std::vector<std::string>({"all", "arm", "i686"}),
		  Cnf.FindVector("Repo::Architectures", "all,arm,i686"));

	// list items win over the default
	Cnf.Set("Repo::Architectures::", "aarch64");
	Cnf.Set("Repo::Architectures::", "x86_64");
	EXPECT_EQ(std::vector<std::string>({"aarch64", "x86_64"}),
		  Cnf.FindVector("Repo::Architectures", "all,arm"));

	// and a value of the node itself wins over the list items
	Cnf.Set("Repo::Architectures", "all,aarch64");
	EXPECT_EQ(std::vector<std::string>({"all", "aarch64"}),
		  Cnf.FindVector("Repo::Architectures", "arm"));
}
TEST(ConfigurationTest,ClearSubtree)
{
	Configuration Cnf;
	Cnf.Set("Repo::Release::Origin", "Termux");
	Cnf.Set("Repo::Release::Label", "Community");
	Cnf.Set("Repo::Distribution", "stable");
	Cnf.Clear("repo::release");
	EXPECT_FALSE(Cnf.Exists("Repo::Release"));
	EXPECT_FALSE(Cnf.Exists("Repo::Release::Origin"));
	EXPECT_EQ("stable", Cnf.Find("Repo::Distribution"));
	Cnf.Clear("Repo::Release::Origin");
	Cnf.Clear("Repo");
	EXPECT_FALSE(Cnf.Exists("Repo::Distribution"));
	EXPECT_FALSE(Cnf.Exists("Repo::"));
}
TEST(ConfigurationTest, Parsing)
{
   Configuration Cnf;
   {
      auto const file = createTemporaryFile("configparsing", R"repo(
# options of the termux community repository
Repo::Distribution "community";
Repo::Sign "yes"; // detached as well
Repo::Architectures { "all"; "arm";
   "aarch64"; };
/* Repo::Contents::Width "120"; */
Repo {
   Component extras;
   Contents::Width "100"; Release::Origin "Termux Community";
   Release {
      Label "Termux";
   };
};
Repo::Compressors { gz; "xz"; }; Repo::Signer "gpg";
)repo");
      EXPECT_TRUE(ReadConfigFile(Cnf, file.Name()));
   }
   EXPECT_EQ("community", Cnf.Find("Repo::Distribution"));
   EXPECT_TRUE(Cnf.FindB("Repo::Sign"));
   EXPECT_EQ(std::vector<std::string>({"all", "arm", "aarch64"}), Cnf.FindVector("Repo::Architectures"));
   EXPECT_EQ("extras", Cnf.Find("Repo::Component"));
   EXPECT_EQ(100, Cnf.FindI("Repo::Contents::Width"));
   EXPECT_EQ("Termux Community", Cnf.Find("Repo::Release::Origin"));
   EXPECT_EQ("Termux", Cnf.Find("Repo::Release::Label"));
   EXPECT_EQ(std::vector<std::string>({"gz", "xz"}), Cnf.FindVector("Repo::Compressors"));
   EXPECT_EQ("gpg", Cnf.Find("Repo::Signer"));
}
TEST(ConfigurationTest, ParsingErrors)
{
   Configuration Cnf;
   {
      auto const file = createTemporaryFile("configbroken", "Repo::Distribution \"stable\"\n");
      EXPECT_FALSE(ReadConfigFile(Cnf, file.Name()));
   }
   EXPECT_TRUE(_error->PendingError());
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_NE(std::string::npos, msg.find("Missing ; at end of file"));
   _error->Discard();

   {
      auto const file = createTemporaryFile("configunmatched", "Repo { Distribution \"stable\"; \n");
      EXPECT_FALSE(ReadConfigFile(Cnf, file.Name()));
   }
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   EXPECT_FALSE(ReadConfigFile(Cnf, "/does/not/exist/repo.conf"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
}
