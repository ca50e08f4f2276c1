#include "commands.hpp"
#include "scratch_dir.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace chkr;

namespace {

void test_worse_wins() {
    const Status all[] = {Status::Ok, Status::Mismatch, Status::Error};
    for (auto a : all) {
        assert(worse(Status::Ok, a) == a);
        assert(worse(a, Status::Error) == Status::Error);
        for (auto b : all) {
            assert(worse(a, b) == worse(b, a));
            for (auto c : all) assert(worse(worse(a, b), c) == worse(a, worse(b, c)));
        }
    }
    assert(exit_code(Status::Ok) == 0);
    assert(exit_code(Status::Mismatch) == 1);
    assert(exit_code(Status::Error) == 2);
    std::cout << "✓ Status fold is associative with Ok as identity\n";
}

void test_format_progress() {
    assert(format_progress({1, 3}) == "(1/3 33.33%)");
    assert(format_progress({3, 3}) == "(3/3 100.00%)");
    assert(describe(Outcome{Match{}}) == "Match");
    assert(describe(Outcome{Mismatch{"aa", "bb"}}) == "Mismatch { expected: aa, actual: bb }");
    std::cout << "✓ Progress and outcome text\n";
}

void test_file_exit_codes() {
    assert(cmd_file(test::fixture("foo.txt"), "4d93d51945b88325c213640ef59fc50b") == 0);
    assert(cmd_file(test::fixture("bar.txt"), "4d93d51945b88325c213640ef59fc50a") == 1);
    assert(cmd_file(test::fixture("does-not-exist.csv"), "ce5188defed222ca612b41580e0d5fe6") == 2);
    std::cout << "✓ file command returns 0 / 1 / 2\n";
}

void test_manifest_exit_codes() {
    assert(cmd_manifest(test::fixture("checksum.txt")) == 2);
    assert(cmd_manifest(test::fixture("no-such-manifest.txt")) == 2);

    test::ScratchDir dir("commands");
    dir.write("a.txt", "abc");
    dir.write("b.txt", "some text\n");

    auto ok = dir.write("ok.md5",
        "900150983cd24fb0d6963f7d28e17f72  a.txt\n"
        "4d93d51945b88325c213640ef59fc50b *b.txt\n");
    assert(cmd_manifest(ok) == 0);

    auto mismatch = dir.write("mismatch.md5",
        "900150983cd24fb0d6963f7d28e17f72  a.txt\n"
        "00000000000000000000000000000000  b.txt\n");
    assert(cmd_manifest(mismatch) == 1);

    auto malformed = dir.write("malformed.md5",
        "900150983cd24fb0d6963f7d28e17f72  a.txt\n"
        "00000000000000000000000000000000\n");
    assert(cmd_manifest(malformed) == 2);

    assert(cmd_manifest(dir.write("empty.md5", "\n\n")) == 0);
    std::cout << "✓ manifest command reduces to the worst status\n";
}

void test_run_manifest_reports_every_entry() {
    auto verifier = verify_manifest(test::fixture("checksum.txt"));
    assert(verifier.has_value());

    std::vector<size_t> processed;
    std::vector<std::string> files;
    Status status = run_manifest(*verifier, [&](const VerifyProgress& p, const ManifestEntry& entry) {
        assert(p.total == 3);
        processed.push_back(p.processed);
        files.push_back(entry ? entry->file : std::string("<parse error>"));
    });

    assert(status == Status::Error);
    assert((processed == std::vector<size_t>{1, 2, 3}));
    assert((files == std::vector<std::string>{"foo.txt", "bar.txt", "file-does-not-exist"}));
    assert(verifier->state() == PipelineState::Exhausted);
    std::cout << "✓ run_manifest reports progress per entry\n";
}

} // namespace

int main() {
    try {
        std::cout << "Testing command layer...\n\n";
        compact::Writer::set_verbosity(compact::Verbosity::Quiet);
        test_worse_wins();
        test_format_progress();
        test_file_exit_codes();
        test_manifest_exit_codes();
        test_run_manifest_reports_every_entry();
        std::cout << "\n✅ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
