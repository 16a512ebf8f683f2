// Tests for final-result dedup and accumulation

#include <cassert>
#include <iostream>
#include <string>

#include "client/transcript_reconciler.hpp"

using scribe::client::TranscriptReconciler;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

}  // namespace

void test_plain_append() {
    TranscriptReconciler r;
    assert(r.commit("a", "the patient reports") == "the patient reports ");
    assert(r.commit("b", "no fever") == "no fever ");
    assert(r.transcript() == "the patient reports no fever ");
    test_passed("plain append");
}

void test_overlap_trimmed_case_insensitive() {
    TranscriptReconciler r;
    r.commit("a", "the patient reports");
    assert(r.commit("b", "Reports chest pain") == "chest pain ");
    assert(r.transcript() == "the patient reports chest pain ");
    test_passed("overlap trimmed case-insensitive");
}

void test_duplicate_id_skipped() {
    TranscriptReconciler r;
    assert(r.commit("a", "blood pressure normal") == "blood pressure normal ");
    assert(r.commit("a", "blood pressure normal").empty());
    assert(r.commit("a", "something else").empty());
    assert(r.transcript() == "blood pressure normal ");
    test_passed("duplicate id skipped");
}

void test_repeated_words_trimmed() {
    TranscriptReconciler r;
    r.commit("a", "heart rate 72");
    assert(r.commit("b", "  rate 72 and regular  ") == "and regular ");
    assert(r.commit("c", "   ").empty());
    assert(r.transcript() == "heart rate 72 and regular ");
    test_passed("repeated words trimmed");
}

// 尾部窗口总以空格结尾, 重叠只在词边界之后的空格处成立:
// 紧跟标点的重复词不会被裁剪
void test_overlap_requires_word_boundary() {
    TranscriptReconciler r;
    r.commit("a", "hello world");
    assert(r.tail() == "hello world ");
    assert(r.commit("b", "World.") == "World. ");
    assert(r.transcript() == "hello world World. ");

    TranscriptReconciler spaced;
    spaced.commit("a", "hello world");
    assert(spaced.commit("b", "World and more") == "and more ");
    assert(spaced.transcript() == "hello world and more ");
    test_passed("overlap requires word boundary");
}

void test_prepare_does_not_mutate() {
    TranscriptReconciler r;
    auto prepared = r.prepare("a", "hello there");
    assert(prepared.has_value());
    assert(*prepared == "hello there ");
    assert(r.transcript().empty());
    assert(r.tail().empty());

    // id 已记录, 即使未 accept
    assert(!r.prepare("a", "hello there").has_value());

    r.accept(*prepared);
    assert(r.transcript() == "hello there ");
    test_passed("prepare does not mutate");
}

void test_tail_window_bounded() {
    TranscriptReconciler r(10);
    r.commit("a", "abcdefghijklmnop");
    assert(r.tail().size() == 10);
    assert(r.tail() == std::string("abcdefghijklmnop ").substr(7));
    assert(r.transcript() == "abcdefghijklmnop ");

    // 超出窗口的重叠不再检测
    assert(r.commit("b", "abcdef more") == "abcdef more ");
    test_passed("tail window bounded");
}

void test_begin_session_keeps_text() {
    TranscriptReconciler r;
    r.commit("a", "first part");
    r.beginSession();
    // 新会话可复用 id, 重叠仍按旧尾部裁剪
    assert(r.commit("a", "part two") == "two ");
    assert(r.transcript() == "first part two ");

    r.reset();
    assert(r.transcript().empty());
    assert(r.tail().empty());
    assert(r.commit("a", "fresh") == "fresh ");
    test_passed("begin session keeps text");
}

void test_overlap_length() {
    assert(TranscriptReconciler::overlapLength("", "abc") == 0);
    assert(TranscriptReconciler::overlapLength("xyz abc", "ABC def") == 3);
    assert(TranscriptReconciler::overlapLength("aaa", "aaaa") == 3);
    assert(TranscriptReconciler::overlapLength("abc", "xyz") == 0);
    test_passed("overlap length");
}

void test_empty_id_never_deduped() {
    TranscriptReconciler r;
    assert(r.commit("", "one") == "one ");
    assert(r.commit("", "two") == "two ");
    test_passed("empty id never deduped");
}

int main() {
    std::cout << "=== Transcript Reconciler Tests ===" << std::endl;

    test_plain_append();
    test_overlap_trimmed_case_insensitive();
    test_duplicate_id_skipped();
    test_repeated_words_trimmed();
    test_overlap_requires_word_boundary();
    test_prepare_does_not_mutate();
    test_tail_window_bounded();
    test_begin_session_keeps_text();
    test_overlap_length();
    test_empty_id_never_deduped();

    std::cout << "All transcript reconciler tests passed" << std::endl;
    return 0;
}
