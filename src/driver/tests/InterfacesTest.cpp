#include "boost/test/unit_test.hpp"
#include "../driver/Interfaces.h"

#include <string>
#include <utility>

using namespace FbDriver;

namespace
{
	class CountedRef
	{
	public:
		explicit CountedRef(int& aReleased)
			: refs(1),
			  released(aReleased)
		{ }

		void addRef()
		{
			++refs;
		}

		void release()
		{
			if (--refs == 0)
				++released;
		}

		int refs;
		int& released;
	};

	class Disposable
	{
	public:
		explicit Disposable(int& aDisposed)
			: disposed(aDisposed)
		{ }

		void dispose()
		{
			++disposed;
		}

		int& disposed;
	};

	enum StatementVariant
	{
		STATEMENT_V3,
		STATEMENT_V4,
		STATEMENT_V5
	};

	const InterfaceVariant STATEMENT_VARIANTS[] = {
		{5, STATEMENT_V5},
		{4, STATEMENT_V4},
		{3, STATEMENT_V3}
	};
}

BOOST_AUTO_TEST_SUITE(DriverSuite)
BOOST_AUTO_TEST_SUITE(InterfacesSuite)


BOOST_AUTO_TEST_CASE(NegotiateVersionTest)
{
	BOOST_TEST(negotiateVersion("IStatement", 5, STATEMENT_VARIANTS) == STATEMENT_V5);
	BOOST_TEST(negotiateVersion("IStatement", 7, STATEMENT_VARIANTS) == STATEMENT_V5);
	BOOST_TEST(negotiateVersion("IStatement", 4, STATEMENT_VARIANTS) == STATEMENT_V4);
	BOOST_TEST(negotiateVersion("IStatement", 3, STATEMENT_VARIANTS) == STATEMENT_V3);

	try
	{
		negotiateVersion("IStatement", 2, STATEMENT_VARIANTS);
		BOOST_FAIL("InterfaceError expected");
	}
	catch (const InterfaceError& ex)
	{
		BOOST_TEST(ex.getMessage() == "Wrong interface version 2, expected 3 (IStatement)");
	}

	BOOST_CHECK_THROW(negotiateVersion("IUtil", 4, STATEMENT_VARIANTS, 0), InterfaceError);
}

BOOST_AUTO_TEST_CASE(MinimalVersionsTest)
{
	BOOST_TEST(unsigned(InterfaceTraits<Firebird::IProvider>::MIN_VERSION) == 4u);
	BOOST_TEST(unsigned(InterfaceTraits<Firebird::IAttachment>::MIN_VERSION) == 3u);
	BOOST_TEST(std::string(InterfaceTraits<Firebird::IEventBlock>::name()) == "IEventBlock");
}

BOOST_AUTO_TEST_CASE(AutoReleaseTest)
{
	int released = 0;

	CountedRef owned(released);

	{
		AutoRelease<CountedRef> ref(&owned);
		BOOST_TEST(ref.hasData());
		BOOST_TEST(ref->refs == 1);
	}

	BOOST_TEST(released == 1);

	CountedRef shared(released);
	shared.addRef();

	{
		AutoRelease<CountedRef> ref;
		BOOST_TEST(!ref.hasData());

		ref.addRef(&shared);
		BOOST_TEST(shared.refs == 3);

		ref.reset();
		BOOST_TEST(shared.refs == 2);
		BOOST_TEST(!ref.hasData());
	}

	BOOST_TEST(shared.refs == 2);
	BOOST_TEST(released == 1);
}

BOOST_AUTO_TEST_CASE(ForgetAfterTerminatingCallTest)
{
	int released = 0;
	CountedRef object(released);
	object.addRef();

	{
		AutoRelease<CountedRef> ref(&object);

		// terminating call released the reference itself
		object.release();
		BOOST_TEST(ref.forget() == &object);
		BOOST_TEST(!ref.hasData());
	}

	BOOST_TEST(object.refs == 1);
	BOOST_TEST(released == 0);
}

BOOST_AUTO_TEST_CASE(MoveTest)
{
	int released = 0;

	AutoRelease<CountedRef> first(new CountedRef(released));
	CountedRef* const raw = first.get();

	AutoRelease<CountedRef> second(std::move(first));
	BOOST_TEST(!first.hasData());
	BOOST_TEST(second.get() == raw);

	AutoRelease<CountedRef> third;
	third = std::move(second);
	BOOST_TEST(third.get() == raw);
	BOOST_TEST(released == 0);

	third.reset();
	BOOST_TEST(released == 1);

	delete raw;
}

BOOST_AUTO_TEST_CASE(AutoDisposeTest)
{
	int disposed = 0;
	Disposable object(disposed);

	{
		AutoDispose<Disposable> ptr(&object);
		BOOST_TEST(ptr.hasData());
	}

	BOOST_TEST(disposed == 1);

	{
		AutoDispose<Disposable> ptr(&object);
		BOOST_TEST(ptr.forget() == &object);
	}

	BOOST_TEST(disposed == 1);
}


BOOST_AUTO_TEST_SUITE_END()	// InterfacesSuite
BOOST_AUTO_TEST_SUITE_END()	// DriverSuite
