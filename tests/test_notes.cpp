
//   Copyright 2016 otris software AG
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//       http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
//
//   This project is hosted at https://github.com/otris

#include "fixtures.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace
{
std::string note_data(const std::string& subject,
                      const std::string& message_class = "IPM.StickyNote")
{
    return "<ApplicationData><notes:Subject>" + subject +
           "</notes:Subject><airsyncbase:Body><airsyncbase:Type>1"
           "</airsyncbase:Type><airsyncbase:Data>" +
           subject +
           " body</airsyncbase:Data></airsyncbase:Body>"
           "<notes:MessageClass>" +
           message_class + "</notes:MessageClass></ApplicationData>";
}

std::string add_command(const std::string& server_id, const std::string& data)
{
    return "<Add><ServerId>" + server_id + "</ServerId>" + data + "</Add>";
}

std::string ews_message(const std::string& id, const std::string& subject,
                        const std::string& item_class = "IPM.StickyNote")
{
    return "<t:Message><t:ItemId Id=\"" + id +
           "\" ChangeKey=\"CK\"/><t:ItemClass>" + item_class +
           "</t:ItemClass><t:Subject>" + subject +
           "</t:Subject><t:Body BodyType=\"Text\">" + subject +
           " body</t:Body></t:Message>";
}

std::string find_item_response(const std::string& items)
{
    return tests::soap_success(
        "FindItem", "<m:RootFolder TotalItemsInView=\"1\"><t:Items>" + items +
                        "</t:Items></m:RootFolder>");
}
} // namespace

namespace tests
{
class NotesTest : public FakeServiceFixture
{
};

TEST_F(NotesTest, CreateNote)
{
    executor().respond(sync_response(
        "notes123", "key457",
        "<Responses><Add><ServerId>5:1</ServerId><Status>1</Status></Add>"
        "</Responses>"));

    const auto res = notes().create_note("Groceries", "Milk & eggs",
                                         eas::category_set{"Home"});
    ASSERT_TRUE(res.ok());
    EXPECT_EQ("5:1", res.value());

    ASSERT_EQ(1U, executor().calls().size());
    const auto& body = executor().last_call().body;
    EXPECT_EQ("Sync", executor().last_call().command);
    EXPECT_TRUE(contains_str(body, "<SyncKey>key456</SyncKey>"));
    EXPECT_TRUE(contains_str(body, "<CollectionId>notes123</CollectionId>"));
    EXPECT_TRUE(contains_str(body, "<notes:Subject>Groceries</notes:Subject>"));
    EXPECT_TRUE(contains_str(body, "Milk &amp; eggs"));
    EXPECT_TRUE(contains_str(body, "<notes:Category>Home</notes:Category>"));
    EXPECT_TRUE(soap().calls().empty());

    EXPECT_EQ("key457", keys().current("notes123"));
}

TEST_F(NotesTest, CreateNoteMatchesClientId)
{
    executor().respond(sync_response(
        "notes123", "key457",
        "<Responses><Add><ClientId>someone-else</ClientId>"
        "<ServerId>5:9</ServerId><Status>1</Status></Add></Responses>"));

    const auto res = notes().create_note("Groceries", "Milk");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(eas::error_code::parse_error, res.error().code());
}

TEST_F(NotesTest, CreateNoteWithoutServerId)
{
    executor().respond(sync_response(
        "notes123", "key457",
        "<Responses><Add><Status>1</Status></Add></Responses>"));

    const auto res = notes().create_note("Groceries", "Milk");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(eas::error_code::parse_error, res.error().code());
}

TEST_F(NotesTest, CreateNoteRejected)
{
    executor().respond(sync_response(
        "notes123", "key457",
        "<Responses><Add><Status>9</Status></Add></Responses>"));

    const auto res = notes().create_note("Groceries", "Milk");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(eas::error_code::quota_exceeded, res.error().code());
    EXPECT_EQ(9, res.error().status());
}

TEST_F(NotesTest, NoNotesFolder)
{
    fake_folder_lookup empty_folders;
    eas::native_notes_backend native(executor(), empty_folders, keys());
    eas::capability_resolver caps(versions());
    eas::ews_notes_backend ews(soap(), versions(), ews_states());
    eas::notes_service service(caps, native, ews);

    const auto res = service.create_note("Groceries", "Milk");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(eas::error_code::folder_not_found, res.error().code());
    EXPECT_TRUE(executor().calls().empty());
}

TEST_F(NotesTest, UpdateNote)
{
    executor().respond(sync_response("notes123", "key457"));

    const auto res = notes().update_note("5:1", "Groceries", "Bread");
    ASSERT_TRUE(res.ok());
    EXPECT_TRUE(res.value());

    const auto& body = executor().last_call().body;
    EXPECT_TRUE(contains_str(body, "<Change><ServerId>5:1</ServerId>"));
    EXPECT_TRUE(contains_str(body, "<GetChanges>0</GetChanges>"));
    EXPECT_FALSE(contains_str(body, "Categories"));
}

TEST_F(NotesTest, UpdateMissingNote)
{
    executor().respond(sync_response(
        "notes123", "key457",
        "<Responses><Change><ServerId>5:1</ServerId><Status>8</Status>"
        "</Change></Responses>"));

    const auto res = notes().update_note("5:1", "Groceries", "Bread");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(eas::error_code::item_not_found, res.error().code());
}

TEST_F(NotesTest, EmptyServerIdIsRejectedLocally)
{
    EXPECT_EQ(eas::error_code::item_not_found,
              notes().update_note("", "a", "b").error().code());
    EXPECT_EQ(eas::error_code::item_not_found,
              notes().delete_note("").error().code());
    EXPECT_EQ(eas::error_code::item_not_found,
              notes().restore_note("").error().code());
    EXPECT_TRUE(executor().calls().empty());
}

TEST_F(NotesTest, DeleteMovesToDeletedItems)
{
    executor().respond(sync_response("notes123", "key457"));

    ASSERT_TRUE(notes().delete_note("5:1").ok());
    const auto& body = executor().last_call().body;
    EXPECT_TRUE(contains_str(body, "<CollectionId>notes123</CollectionId>"));
    EXPECT_TRUE(contains_str(body, "<DeletesAsMoves>1</DeletesAsMoves>"));
    EXPECT_TRUE(
        contains_str(body, "<Delete><ServerId>5:1</ServerId></Delete>"));
}

TEST_F(NotesTest, DeletePermanently)
{
    executor().respond(sync_response("deleted4", "key457"));

    ASSERT_TRUE(notes().delete_note_permanently("4:1").ok());
    const auto& body = executor().last_call().body;
    EXPECT_TRUE(contains_str(body, "<CollectionId>deleted4</CollectionId>"));
    EXPECT_TRUE(contains_str(body, "<DeletesAsMoves>0</DeletesAsMoves>"));
    EXPECT_TRUE(
        contains_str(body, "<Delete><ServerId>4:1</ServerId></Delete>"));
}

TEST_F(NotesTest, RestoreNote)
{
    executor().respond("<MoveItems xmlns=\"Move\"><Response>"
                       "<SrcMsgId>4:1</SrcMsgId><Status>3</Status>"
                       "<DstMsgId>10:7</DstMsgId></Response></MoveItems>");

    const auto res = notes().restore_note("4:1");
    ASSERT_TRUE(res.ok());
    EXPECT_EQ("10:7", res.value());
    EXPECT_NE("4:1", res.value());

    EXPECT_EQ("MoveItems", executor().last_call().command);
    const auto& body = executor().last_call().body;
    EXPECT_TRUE(contains_str(body, "<SrcMsgId>4:1</SrcMsgId>"));
    EXPECT_TRUE(contains_str(body, "<SrcFldId>deleted4</SrcFldId>"));
    EXPECT_TRUE(contains_str(body, "<DstFldId>notes123</DstFldId>"));
}

TEST_F(NotesTest, RestoreUnknownNote)
{
    executor().respond("<MoveItems xmlns=\"Move\"><Response>"
                       "<SrcMsgId>4:1</SrcMsgId><Status>1</Status>"
                       "</Response></MoveItems>");

    const auto res = notes().restore_note("4:1");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(eas::error_code::item_not_found, res.error().code());
}

TEST_F(NotesTest, InvalidSyncKeyIsReportedEveryTime)
{
    executor().respond(sync_response("notes123", "", "", 3));
    executor().respond(sync_response("notes123", "", "", 3));

    for (int i = 0; i < 2; ++i)
    {
        bool applied = false;
        const auto res = notes().sync_note_changes(
            [&](const eas::note_changes&) { applied = true; });
        ASSERT_FALSE(res.ok());
        EXPECT_EQ(eas::error_code::invalid_sync_key, res.error().code());
        EXPECT_FALSE(applied);
        EXPECT_EQ("0", keys().current("notes123"));
    }
    EXPECT_EQ(2U, keys().resets().size());
}

TEST_F(NotesTest, SyncNoteChanges)
{
    executor().respond(sync_response(
        "notes123", "key457",
        "<MoreAvailable/><Commands>" + add_command("5:1", note_data("A")) +
            "<Delete><ServerId>5:2</ServerId></Delete></Commands>"));

    eas::note_changes received;
    const auto res = notes().sync_note_changes(
        [&](const eas::note_changes& changes) { received = changes; });
    ASSERT_TRUE(res.ok());
    EXPECT_TRUE(res.value());

    ASSERT_EQ(1U, received.upserted.size());
    EXPECT_EQ("A", received.upserted[0].subject);
    EXPECT_EQ("A body", received.upserted[0].body);
    EXPECT_EQ("notes123", received.upserted[0].folder_id);
    EXPECT_EQ(std::vector<std::string>{"5:2"}, received.deleted);
    EXPECT_EQ("key457", keys().current("notes123"));
}

TEST_F(NotesTest, FailedApplyDoesNotAdvance)
{
    executor().respond(sync_response(
        "notes123", "key457",
        "<Commands>" + add_command("5:1", note_data("A")) + "</Commands>"));

    EXPECT_THROW(notes().sync_note_changes([](const eas::note_changes&) {
        throw std::runtime_error("storage failure");
    }),
                 std::runtime_error);
    EXPECT_EQ("key456", keys().current("notes123"));
}

// Version 12.1 has no Notes class in ActiveSync
TEST_F(NotesTest, OldServersUseEws)
{
    versions().set_version("12.1");
    soap().respond(soap_success(
        "CreateItem", "<m:Items><t:Message><t:ItemId Id=\"AAMk\" "
                      "ChangeKey=\"CQAA\"/></t:Message></m:Items>"));

    const auto res = notes().create_note("Groceries", "Milk & eggs");
    ASSERT_TRUE(res.ok());
    EXPECT_EQ("AAMk", res.value());
    EXPECT_TRUE(executor().calls().empty());

    ASSERT_EQ(1U, soap().calls().size());
    const auto& envelope = soap().calls()[0].envelope;
    EXPECT_EQ("CreateItem", soap().calls()[0].action);
    EXPECT_TRUE(contains_str(envelope, "Version=\"Exchange2007_SP1\""));
    EXPECT_TRUE(
        contains_str(envelope, "<t:ItemClass>IPM.StickyNote</t:ItemClass>"));
    EXPECT_TRUE(contains_str(envelope, "Milk &amp; eggs"));
}

TEST_F(NotesTest, EwsUpdateUsesCurrentChangeKey)
{
    versions().set_version("12.1");
    soap().respond(soap_success(
        "GetItem", "<m:Items><t:Message><t:ItemId Id=\"AAMk\" "
                   "ChangeKey=\"CK2\"/></t:Message></m:Items>"));
    soap().respond(soap_success("UpdateItem"));

    ASSERT_TRUE(notes().update_note("AAMk", "Groceries", "Bread").ok());
    ASSERT_EQ(2U, soap().calls().size());
    EXPECT_EQ("GetItem", soap().calls()[0].action);
    EXPECT_EQ("UpdateItem", soap().calls()[1].action);
    EXPECT_TRUE(contains_str(soap().calls()[1].envelope,
                             "<t:ItemId Id=\"AAMk\" ChangeKey=\"CK2\"/>"));
}

TEST_F(NotesTest, EwsDelete)
{
    versions().set_version("12.1");
    soap().respond(soap_success("DeleteItem"));
    soap().respond(soap_error("DeleteItem", "ErrorItemNotFound"));
    soap().respond(soap_error("DeleteItem", "ErrorAccessDenied"));

    ASSERT_TRUE(notes().delete_note("AAMk").ok());
    EXPECT_TRUE(contains_str(soap().calls()[0].envelope,
                             "DeleteType=\"MoveToDeletedItems\""));

    // Already gone
    ASSERT_TRUE(notes().delete_note_permanently("AAMk").ok());
    EXPECT_TRUE(
        contains_str(soap().calls()[1].envelope, "DeleteType=\"HardDelete\""));

    const auto res = notes().delete_note("AAMk");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(eas::error_code::server_status, res.error().code());
}

TEST_F(NotesTest, EwsRestore)
{
    versions().set_version("12.1");
    soap().respond(soap_success(
        "MoveItem", "<m:Items><t:Message><t:ItemId Id=\"NEW\" "
                    "ChangeKey=\"CK\"/></t:Message></m:Items>"));

    const auto res = notes().restore_note("OLD");
    ASSERT_TRUE(res.ok());
    EXPECT_EQ("NEW", res.value());
    EXPECT_TRUE(contains_str(soap().calls()[0].envelope,
                             "<t:DistinguishedFolderId Id=\"notes\"/>"));
}

TEST_F(NotesTest, EwsSyncNotes)
{
    versions().set_version("12.1");
    soap().respond(find_item_response(ews_message("N1", "")));
    soap().respond(
        soap_success("GetItem", "<m:Items>" + ews_message("N1", "A") +
                                    "</m:Items>"));
    soap().respond(find_item_response(ews_message("D1", "") +
                                      ews_message("M1", "", "IPM.Note")));
    soap().respond(
        soap_success("GetItem", "<m:Items>" + ews_message("D1", "B") +
                                    "</m:Items>"));

    const auto res = notes().sync_notes();
    ASSERT_TRUE(res.ok());
    const auto& all = res.value();
    ASSERT_EQ(2U, all.size());
    EXPECT_EQ("N1", all[0].server_id);
    EXPECT_EQ("A", all[0].subject);
    EXPECT_FALSE(all[0].is_deleted);
    EXPECT_EQ("D1", all[1].server_id);
    EXPECT_TRUE(all[1].is_deleted);

    // The mail in Deleted Items is not fetched
    EXPECT_FALSE(contains_str(soap().calls()[3].envelope, "M1"));
}

TEST_F(NotesTest, EwsIncrementalSync)
{
    versions().set_version("12.1");
    soap().respond(soap_success(
        "SyncFolderItems",
        "<m:SyncState>state1</m:SyncState>"
        "<m:IncludesLastItemInRange>false</m:IncludesLastItemInRange>"
        "<m:Changes>"
        "<t:Create><t:Message><t:ItemId Id=\"N1\" ChangeKey=\"CK\"/>"
        "</t:Message></t:Create>"
        "<t:ReadFlagChange><t:ItemId Id=\"N3\" ChangeKey=\"CK\"/>"
        "<t:IsRead>true</t:IsRead></t:ReadFlagChange>"
        "<t:Delete><t:ItemId Id=\"N2\" ChangeKey=\"CK\"/></t:Delete>"
        "</m:Changes>"));
    soap().respond(
        soap_success("GetItem", "<m:Items>" + ews_message("N1", "A") +
                                    "</m:Items>"));
    soap().respond(soap_success(
        "SyncFolderItems",
        "<m:SyncState>state2</m:SyncState>"
        "<m:IncludesLastItemInRange>true</m:IncludesLastItemInRange>"
        "<m:Changes/>"));

    eas::note_changes first;
    auto res = notes().sync_note_changes(
        [&](const eas::note_changes& changes) { first = changes; });
    ASSERT_TRUE(res.ok());
    EXPECT_TRUE(res.value());
    ASSERT_EQ(1U, first.upserted.size());
    EXPECT_EQ("N1", first.upserted[0].server_id);
    EXPECT_EQ("A", first.upserted[0].subject);
    ASSERT_EQ(1U, first.deleted.size());
    EXPECT_EQ("N2", first.deleted[0]);
    EXPECT_EQ("state1",
              ews_states().key(eas::ews_notes_backend::sync_state_id()));

    // The first request starts from scratch
    EXPECT_EQ("SyncFolderItems", soap().calls()[0].action);
    EXPECT_FALSE(contains_str(soap().calls()[0].envelope, "SyncState"));
    EXPECT_FALSE(contains_str(soap().calls()[1].envelope, "N3"));

    bool applied = false;
    res = notes().sync_note_changes([&](const eas::note_changes& changes) {
        applied = true;
        EXPECT_TRUE(changes.upserted.empty());
        EXPECT_TRUE(changes.deleted.empty());
    });
    ASSERT_TRUE(res.ok());
    EXPECT_FALSE(res.value());
    EXPECT_TRUE(applied);
    ASSERT_EQ(3U, soap().calls().size());
    EXPECT_TRUE(contains_str(soap().calls()[2].envelope,
                             "<m:SyncState>state1</m:SyncState>"));
    EXPECT_EQ("state2",
              ews_states().key(eas::ews_notes_backend::sync_state_id()));

    // Below 14.0 notes never go through ActiveSync
    EXPECT_TRUE(executor().calls().empty());
}

TEST_F(NotesTest, EwsIncrementalSyncResetsRejectedState)
{
    versions().set_version("12.1");
    const auto id = eas::ews_notes_backend::sync_state_id();
    ews_states().advance(id, "stale");
    soap().respond(
        soap_error("SyncFolderItems", "ErrorInvalidSyncStateData"));

    bool applied = false;
    const auto res = notes().sync_note_changes(
        [&](const eas::note_changes&) { applied = true; });
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(eas::error_code::invalid_sync_key, res.error().code());
    EXPECT_FALSE(applied);
    EXPECT_EQ(eas::sync_state::unsynced, ews_states().state(id));
    EXPECT_TRUE(executor().calls().empty());
}

TEST_F(NotesTest, EwsIncrementalSyncKeepsStateWhenApplyFails)
{
    versions().set_version("12.1");
    const auto id = eas::ews_notes_backend::sync_state_id();
    ews_states().advance(id, "state1");
    soap().respond(soap_success(
        "SyncFolderItems",
        "<m:SyncState>state2</m:SyncState>"
        "<m:IncludesLastItemInRange>true</m:IncludesLastItemInRange>"
        "<m:Changes><t:Delete><t:ItemId Id=\"N2\"/></t:Delete></m:Changes>"));

    EXPECT_THROW(notes().sync_note_changes([](const eas::note_changes&) {
        throw std::runtime_error("disk full");
    }),
                 std::runtime_error);
    EXPECT_EQ("state1", ews_states().key(id));
}

// Full syncs with the real sync key state machine
class NotesSyncTest : public BaseFixture
{
public:
    NotesSyncTest()
        : engine_(executor_, store_), versions_("14.1"), caps_(versions_),
          native_(executor_, folders_, engine_),
          ews_(soap_, versions_, store_),
          notes_(caps_, native_, ews_)
    {
        folders_.add(eas::folder_type::notes, "notes123");
    }

    fake_command_executor& executor() { return executor_; }
    fake_folder_lookup& folders() { return folders_; }
    eas::sync_key_store& store() { return store_; }
    eas::notes_service& notes() { return notes_; }

private:
    fake_command_executor executor_;
    fake_soap_executor soap_;
    fake_folder_lookup folders_;
    eas::sync_key_store store_;
    eas::sync_engine engine_;
    fake_version_source versions_;
    eas::capability_resolver caps_;
    eas::native_notes_backend native_;
    eas::ews_notes_backend ews_;
    eas::notes_service notes_;
};

TEST_F(NotesSyncTest, SyncsNotesAndDeletedItems)
{
    folders().add(eas::folder_type::deleted_items, "deleted4");
    store().advance("notes123", "stale");

    executor().respond(sync_response("notes123", "n1"));
    executor().respond(sync_response(
        "notes123", "n2",
        "<Commands>" + add_command("5:1", note_data("A")) + "</Commands>"));
    executor().respond(sync_response("deleted4", "d1"));
    executor().respond(sync_response(
        "deleted4", "d2",
        "<Commands>" + add_command("4:1", note_data("B")) +
            add_command("4:2", note_data("Mail", "IPM.Note")) +
            "</Commands>"));

    const auto res = notes().sync_notes();
    ASSERT_TRUE(res.ok());
    const auto& all = res.value();
    ASSERT_EQ(2U, all.size());
    EXPECT_EQ("5:1", all[0].server_id);
    EXPECT_FALSE(all[0].is_deleted);
    EXPECT_EQ("4:1", all[1].server_id);
    EXPECT_EQ("deleted4", all[1].folder_id);
    EXPECT_TRUE(all[1].is_deleted);

    // A full sync starts from key 0 regardless of the stored key
    ASSERT_EQ(4U, executor().calls().size());
    EXPECT_EQ(eas::internal::initial_sync_request("notes123"),
              executor().calls()[0].body);
    EXPECT_EQ(eas::internal::initial_sync_request("deleted4"),
              executor().calls()[2].body);

    EXPECT_EQ("n2", store().key("notes123"));
    EXPECT_EQ("d2", store().key("deleted4"));
    EXPECT_EQ(1, folders().refreshes());
}

TEST_F(NotesSyncTest, PagesThroughMoreAvailable)
{
    executor().respond(sync_response("notes123", "n1"));
    executor().respond(sync_response(
        "notes123", "n2",
        "<MoreAvailable/><Commands>" + add_command("5:1", note_data("A")) +
            "</Commands>"));
    executor().respond(sync_response(
        "notes123", "n3",
        "<Commands>" + add_command("5:2", note_data("B")) + "</Commands>"));

    const auto res = notes().sync_notes();
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(2U, res.value().size());
    EXPECT_EQ("B", res.value()[1].subject);
    EXPECT_TRUE(contains_str(executor().last_call().body,
                             "<SyncKey>n2</SyncKey>"));
    EXPECT_EQ("n3", store().key("notes123"));
}

TEST_F(NotesSyncTest, EmptyMailbox)
{
    folders().add(eas::folder_type::deleted_items, "deleted4");
    executor().respond(sync_response("notes123", "n1"));
    executor().respond("");
    executor().respond(sync_response("deleted4", "d1"));
    executor().respond("");

    const auto res = notes().sync_notes();
    ASSERT_TRUE(res.ok());
    EXPECT_TRUE(res.value().empty());
    EXPECT_EQ("n1", store().key("notes123"));
    EXPECT_EQ("d1", store().key("deleted4"));
}
} // namespace tests
