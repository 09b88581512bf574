// NOLINTBEGIN

#include <gtest/gtest.h>

#include <algorithm>

#include <wrapcoin/state_db/state_delta.hpp>

using bytes = std::vector< std::byte >;

TEST( state_delta, crud )
{
  auto delta = std::make_shared< wrapcoin::state_db::state_delta >();
  ASSERT_TRUE( delta );

  EXPECT_EQ( delta->revision(), 0 );
  EXPECT_TRUE( delta->root() );
  EXPECT_FALSE( delta->parent() );

  EXPECT_FALSE( delta->get( { std::byte{ 0x01 } } ) );

  bytes key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  delta->put( bytes( key_1 ), value_1 );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  bytes value_1a{ std::byte{ 0x10 }, std::byte{ 0x11 }, std::byte{ 0x12 } };
  delta->put( bytes( key_1 ), value_1a );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  delta->remove( bytes( key_1 ) );
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_FALSE( delta->removed( key_1 ) );

  EXPECT_THROW( delta->squash(), std::runtime_error );
}

TEST( state_delta, child_reads_through_parent )
{
  auto root = std::make_shared< wrapcoin::state_db::state_delta >();

  bytes key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  bytes key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  root->put( bytes( key_1 ), value_1 );
  root->put( bytes( key_2 ), value_2 );

  auto child = root->make_child();
  EXPECT_EQ( child->revision(), 1 );
  EXPECT_FALSE( child->root() );

  if( auto value = child->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "child did not read through to its parent";

  bytes value_1a{ std::byte{ 0x11 } };
  child->put( bytes( key_1 ), value_1a );
  child->remove( bytes( key_2 ) );

  EXPECT_TRUE( child->removed( key_2 ) );
  EXPECT_FALSE( child->get( key_2 ) );
  EXPECT_TRUE( std::ranges::equal( *child->get( key_1 ), value_1a ) );

  // The parent is untouched until the child is squashed
  EXPECT_TRUE( std::ranges::equal( *root->get( key_1 ), value_1 ) );
  EXPECT_TRUE( std::ranges::equal( *root->get( key_2 ), value_2 ) );

  child->squash();

  EXPECT_TRUE( std::ranges::equal( *root->get( key_1 ), value_1a ) );
  EXPECT_FALSE( root->get( key_2 ) );
  EXPECT_FALSE( root->removed( key_2 ) );

  EXPECT_THROW( child->squash(), std::runtime_error );
  EXPECT_THROW( child->put( bytes( key_1 ), value_1 ), std::runtime_error );
}

TEST( state_delta, dropped_child_discards_writes )
{
  auto root = std::make_shared< wrapcoin::state_db::state_delta >();

  bytes key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  root->put( bytes( key_1 ), value_1 );

  {
    auto child = root->make_child();
    child->remove( bytes( key_1 ) );
    child->put( bytes{ std::byte{ 0x02 } }, value_1 );
  }

  EXPECT_TRUE( std::ranges::equal( *root->get( key_1 ), value_1 ) );
  EXPECT_FALSE( root->get( bytes{ std::byte{ 0x02 } } ) );
}

TEST( state_delta, nested_removal_shadows_grandparent )
{
  auto root = std::make_shared< wrapcoin::state_db::state_delta >();

  bytes key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  root->put( bytes( key_1 ), value_1 );

  auto child      = root->make_child();
  auto grandchild = child->make_child();
  EXPECT_EQ( grandchild->revision(), 2 );

  grandchild->remove( bytes( key_1 ) );
  grandchild->squash();

  EXPECT_TRUE( child->removed( key_1 ) );
  EXPECT_FALSE( child->get( key_1 ) );
  EXPECT_TRUE( root->get( key_1 ) );

  child->put( bytes( key_1 ), value_1 );
  EXPECT_FALSE( child->removed( key_1 ) );

  child->remove( bytes( key_1 ) );
  child->squash();

  EXPECT_FALSE( root->get( key_1 ) );
}

// NOLINTEND
