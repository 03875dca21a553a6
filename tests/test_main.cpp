#include <gtest/gtest.h>

#include <QCoreApplication>

// HttpClient runs a local event loop, which needs an application object.
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
